#pragma once
/**
 * @file file_upload.hpp
 * @brief Write a file on the device through the file system group.
 */

#include "mcumgr/upload.hpp"

namespace mcumgr {

class FileUploader : public Uploader {
public:
  FileUploader(Client& client, UploadObserver& observer,
               const TransferConfig& cfg = TransferConfig());
  ~FileUploader() override;

  /// Upload @p data to @p path, replacing any existing file.
  Error start(const std::string& path, Bytes data);

protected:
  Document make_body(const TransferSession& s, const uint8_t* data, std::size_t n) const override;
  uint16_t group() const override;
  uint8_t  command() const override;
};

} // namespace mcumgr

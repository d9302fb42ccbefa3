#pragma once
/**
 * @file image_upload.hpp
 * @brief Firmware image upload into a device image slot.
 *
 * Image 0 is the device's default slot and is not sent on the wire.
 */

#include "mcumgr/upload.hpp"

namespace mcumgr {

class ImageUploader : public Uploader {
public:
  ImageUploader(Client& client, UploadObserver& observer,
                const TransferConfig& cfg = TransferConfig());
  ~ImageUploader() override;

  Error start(uint8_t image, Bytes data);

protected:
  Document make_body(const TransferSession& s, const uint8_t* data, std::size_t n) const override;
  uint16_t group() const override;
  uint8_t  command() const override;
};

} // namespace mcumgr

#pragma once
/**
 * @file file_download.hpp
 * @brief Chunked download of one file from the device's file system group.
 *
 * Each round asks for `{name, off}` and expects `{off, data}` back; the first
 * reply also carries `len`, the full file size. The downloader appends the
 * chunk, moves the offset forward and reports progress until `off == len`.
 */

#include <string>
#include "mcumgr/transfer.hpp"

namespace mcumgr {

class DownloadObserver : public TransferObserver {
public:
  /// Fired once with the whole file.
  virtual void on_download_completed(const Bytes& data) = 0;
};

class FileDownloader : public TransferController {
public:
  FileDownloader(Client& client, DownloadObserver& observer,
                 const TransferConfig& cfg = TransferConfig());
  ~FileDownloader() override;

  /// Begin downloading @p path. Returns at once; events follow on the notifier thread.
  Error start(const std::string& path);

protected:
  Error build_chunk(const TransferSession& s, Op& op, uint16_t& group,
                    uint8_t& id, Document& body) override;
  Error apply_chunk(const Response& rsp, TransferSession& s) override;
  void  notify_completed(Bytes&& data) override;

private:
  DownloadObserver& observer_;
};

} // namespace mcumgr

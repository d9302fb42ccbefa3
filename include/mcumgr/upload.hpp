#pragma once
/**
 * @file upload.hpp
 * @brief Shared slicing and acknowledgement rules for chunked uploads.
 *
 * An upload sends `{off, data, ...}` and the device answers `{off}` with the
 * next offset it expects. Each chunk carries as many bytes as fit in one
 * packet: the CBOR body is measured with empty data first, and the data
 * length is then grown while the byte-string head still fits.
 */

#include <string>
#include "mcumgr/transfer.hpp"

namespace mcumgr {

class UploadObserver : public TransferObserver {
public:
  /// Fired once when the device has acknowledged the last byte.
  virtual void on_upload_completed() = 0;
};

class Uploader : public TransferController {
protected:
  Uploader(Client& client, UploadObserver& observer, const TransferConfig& cfg)
      : TransferController(client, observer, cfg), observer_(observer) {}

  /// Begin sending @p data as @p resource.
  Error start_upload(std::string resource, Bytes data);

  /// Request body for @p n bytes of @p data at @p s.offset.
  virtual Document make_body(const TransferSession& s, const uint8_t* data, std::size_t n) const = 0;
  virtual uint16_t group() const = 0;
  virtual uint8_t  command() const = 0;

  Error build_chunk(const TransferSession& s, Op& op, uint16_t& group,
                    uint8_t& id, Document& body) override;
  Error apply_chunk(const Response& rsp, TransferSession& s) override;
  void  notify_completed(Bytes&& data) override;

private:
  UploadObserver& observer_;
};

} // namespace mcumgr

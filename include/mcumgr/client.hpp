#pragma once
/**
 * @file client.hpp
 * @brief One SMP request/response exchange over an ITransport.
 *
 * The client is the only place that turns (op, group, id, body) into packet
 * bytes and turns link results into `ErrorCode`s. Higher layers (commands,
 * transfer controllers) never touch header bytes or SendResult directly.
 *
 * Sequence numbers: one 8-bit counter per client, wrapping at 255. A reply
 * whose header carries a different number is a leftover from an earlier
 * attempt and is reported as `SequenceMismatch`.
 *
 * Concurrency: when the transport does not allow concurrent use, a second
 * thread calling `execute()` while an exchange is pending gets
 * `TransportBusy` at once. Nothing is queued.
 */

#include <atomic>
#include <cstdint>
#include <mutex>
#include "mcumgr/error.hpp"
#include "mcumgr/header.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/response.hpp"
#include "mcumgr/transport/transport_base.hpp"

namespace mcumgr {

/// Header + CBOR body for one request. False if the body exceeds 65535 bytes.
bool encode_request(Op op, uint16_t group, uint8_t seq, uint8_t id,
                    const Document& body, Bytes& out);

class Client {
public:
  explicit Client(transport::ITransport& t) : transport_(t) {}

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * @brief Send one request and wait for its reply.
   *
   * @param out Filled whenever a reply was decoded, including replies that
   *            end in `NonZeroReturnCode`, so callers can inspect the body.
   * @return Ok; a transport code; a decode code; `SequenceMismatch`;
   *         `MtuTooSmall` when the packet does not fit the link;
   *         `NonZeroReturnCode{rc}` when the device rejected the command.
   */
  Error execute(Op op, uint16_t group, uint8_t id, const Document& body, Response& out);

  transport::ITransport&       transport()       { return transport_; }
  const transport::ITransport& transport() const { return transport_; }

  /// Sequence number the next request will use.
  uint8_t peek_seq() const { return seq_.load(); }

private:
  Error exchange(const Bytes& request, uint8_t seq, Response& out);

  transport::ITransport& transport_;
  std::atomic<uint8_t>   seq_{0};
  std::mutex             io_mutex_;
};

} // namespace mcumgr

#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, link-agnostic transport interface for mcumgr exchanges.
 *
 * Header-only on purpose. The client and the transfer controllers depend on
 * this contract alone, so serial, BLE and CoAP/UDP links are interchangeable.
 */

#include <cstddef>
#include <cstdint>
#include <vector>
#include "mcumgr/scheme.hpp"

namespace mcumgr::transport {

// Return codes kept simple; the client maps them onto ErrorCode.
enum class SendResult : uint8_t { Ok=0, Timeout=1, Disconnected=2, Busy=3, Error=4 };

struct Config {
  // You can extend per-transport via downcast or specialized ctors.
  uint16_t mtu{252};        // SMP packet bytes per exchange
  int      timeout_ms{3000};
};

/**
 * @brief One reply as the link delivered it.
 *
 * Standard schemes fill `bytes` with header + body. CoAP links also split the
 * packet: `header` holds the SMP header taken from the `_h` field (may be
 * empty), `payload` the CBOR body, and the CoAP response code class/detail.
 */
struct RawReply {
  std::vector<uint8_t> bytes;
  std::vector<uint8_t> header;
  std::vector<uint8_t> payload;
  uint8_t code_class{2};
  uint8_t code_detail{5};

  void clear() {
    bytes.clear(); header.clear(); payload.clear();
    code_class = 2; code_detail = 5;
  }
};

/**
 * @brief Transport trait every link wrapper implements.
 *
 * Contract:
 *  - send(req, reply) transmits one SMP packet and blocks the calling thread
 *    until a reply arrives or the link's own timeout expires.
 *  - mtu() is the largest SMP packet (header + body) one exchange can carry.
 *  - scheme() tells the core which response builder applies.
 *  - request_high_throughput() asks the link for a faster connection mode;
 *    links without one return false and the core carries on.
 *  - allows_concurrent_use() is false for links that can only have one
 *    exchange outstanding; the client then fails concurrent callers fast.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual SendResult  send(const std::vector<uint8_t>& request, RawReply& reply) = 0;
  virtual std::size_t mtu() const = 0;
  virtual Scheme      scheme() const = 0;
  virtual const char* name() const = 0;

  virtual bool request_high_throughput() { return false; }
  virtual bool allows_concurrent_use() const { return false; }
};

} // namespace mcumgr::transport

/**
 * @file header.hpp
 * @brief The 8-byte SMP header that prefixes every standard-scheme packet.
 *
 * @details
 * Every request and response exchanged with a device's management agent
 * starts with this header. It names the operation, the command (group + id),
 * the payload length, and a sequence number the host uses to pair a reply
 * with the request that caused it.
 *
 * ### Byte layout (8 bytes, multi-byte fields big-endian):
 *
 * | Byte | Contents                       | Description                            |
 * |------|--------------------------------|----------------------------------------|
 * | 0    | `res:3 + version:2 + op:3`     | op in the low 3 bits                   |
 * | 1    | `flags`                        | reserved flag bits                     |
 * | 2–3  | `len`                          | payload bytes that follow the header   |
 * | 4–5  | `group`                        | command group                          |
 * | 6    | `seq`                          | sequence number, wraps at 255          |
 * | 7    | `id`                           | command id within the group            |
 *
 * The layout is fixed by the device firmware. Do not reorder.
 *
 * @note Ops 4..7 are reserved; `decode()` refuses them.
 */
#ifndef MCUMGR_HEADER_HPP
#define MCUMGR_HEADER_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/array.h"
#include "etl/string.h"
#include "mcumgr/error.hpp"

namespace mcumgr {

/// Size of the header on the wire.
static constexpr size_t HEADER_LENGTH = 8;

/// Raw header bytes, exactly as sent.
using HeaderBytes = etl::array<uint8_t, HEADER_LENGTH>;

/// Header operation codes.
enum class Op : uint8_t {
  Read          = 0,
  ReadResponse  = 1,
  Write         = 2,
  WriteResponse = 3
};

/// SMP protocol versions carried in bits 3..4 of byte 0.
enum : uint8_t {
  PROTOCOL_V1 = 0,
  PROTOCOL_V2 = 1
};

struct Header {
  Op       op{Op::Read};
  uint8_t  version{PROTOCOL_V1};
  uint8_t  flags{0};
  uint16_t len{0};
  uint16_t group{0};
  uint8_t  seq{0};
  uint8_t  id{0};

  Header() = default;
  Header(Op op, uint8_t flags, uint16_t len, uint16_t group, uint8_t seq, uint8_t id)
    : op(op), flags(flags), len(len), group(group), seq(seq), id(id) {}

  /// Write the 8 wire bytes.
  HeaderBytes pack() const;

  /**
   * @brief Parse the first 8 bytes of @p data into @p out.
   * @return `MalformedHeader` if @p n < 8 or the op is reserved; @p out is
   *         left untouched in that case.
   */
  static Error decode(const uint8_t* data, size_t n, Header& out);

  /// Debug line, e.g. "OP:1 V:0 FL:0 LEN:12 GRP:8 SEQ:3 ID:0".
  etl::string<64> to_string() const;

  /// True for ReadResponse / WriteResponse.
  bool is_response() const {
    return op == Op::ReadResponse || op == Op::WriteResponse;
  }
};

/// Build the header bytes for a packet with a @p payload_len byte payload.
HeaderBytes encode_header(Op op, uint8_t flags, uint16_t group, uint8_t seq,
                          uint8_t id, uint16_t payload_len);

} // namespace mcumgr

#endif // MCUMGR_HEADER_HPP

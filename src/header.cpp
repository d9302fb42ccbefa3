// -----------------------------------------------------------------------------
// @file header.cpp
// @brief Packing and unpacking of the 8-byte SMP header.
//
// This file provides the implementation for the Header struct, the fixed
// 8-byte prefix of every standard-scheme SMP packet.
//
// Implemented here:
// - pack()          : fields -> 8 wire bytes
// - decode()        : 8 wire bytes -> fields, rejecting reserved ops
// - to_string()     : one-line debug rendering into an etl::string
// - encode_header() : convenience wrapper used by request builders
//
// @note Pure functions over byte buffers; no allocation, safe on both Linux
//       and microcontroller builds.
// -----------------------------------------------------------------------------
#include "mcumgr/header.hpp"
#include <stdio.h>

namespace mcumgr {

// =============================================================================
// Packing & Unpacking
// =============================================================================

// Write the 8 wire bytes.
// Byte 0 carries op (bits 0..2) and version (bits 3..4); bits 5..7 stay zero.
// Multi-byte fields are big-endian.
HeaderBytes Header::pack() const {
    HeaderBytes b;

    // op in bits 0..2, version in bits 3..4, bits 5..7 stay zero
    b[0] = static_cast<uint8_t>((static_cast<uint8_t>(op) & 0x07) | ((version & 0x03) << 3));
    b[1] = flags;                                        // passed through untouched

    // length and group are big-endian on the wire
    b[2] = static_cast<uint8_t>(len >> 8);               // len high byte
    b[3] = static_cast<uint8_t>(len & 0xFF);             // len low byte
    b[4] = static_cast<uint8_t>(group >> 8);             // group high byte
    b[5] = static_cast<uint8_t>(group & 0xFF);           // group low byte

    b[6] = seq;                                          // echoed back by the device
    b[7] = id;                                           // command id within the group
    return b;
}

// Parse the first 8 bytes of a buffer.
// Rejects short input and the reserved ops 4..7; `out` is only written on success.
Error Header::decode(const uint8_t* data, size_t n, Header& out) {
    if (data == nullptr || n < HEADER_LENGTH) return Error(ErrorCode::MalformedHeader);

    const uint8_t raw_op = data[0] & 0x07;               // bits 0..2
    if (raw_op > static_cast<uint8_t>(Op::WriteResponse)) return Error(ErrorCode::MalformedHeader);

    Header h;
    h.op      = static_cast<Op>(raw_op);
    h.version = (data[0] >> 3) & 0x03;                   // bits 3..4; 5..7 ignored
    h.flags   = data[1];
    h.len     = static_cast<uint16_t>((data[2] << 8) | data[3]);
    h.group   = static_cast<uint16_t>((data[4] << 8) | data[5]);
    h.seq     = data[6];
    h.id      = data[7];

    out = h;                                             // commit only a complete parse
    return Error();
}

// =============================================================================
// String Conversion
// =============================================================================

// Debug line, e.g. "OP:1 V:0 FL:0 LEN:12 GRP:8 SEQ:3 ID:0".
// Worst case is well under 64 characters, so the fixed string never truncates.
etl::string<64> Header::to_string() const {
    char buf[64];
    snprintf(buf, sizeof(buf), "OP:%u V:%u FL:%u LEN:%u GRP:%u SEQ:%u ID:%u",
             static_cast<unsigned>(op), static_cast<unsigned>(version),
             static_cast<unsigned>(flags), static_cast<unsigned>(len),
             static_cast<unsigned>(group), static_cast<unsigned>(seq),
             static_cast<unsigned>(id));
    return etl::string<64>(buf);
}

// =============================================================================
// Helpers
// =============================================================================

// Header bytes for a request or reply whose encoded body is payload_len long.
HeaderBytes encode_header(Op op, uint8_t flags, uint16_t group, uint8_t seq,
                          uint8_t id, uint16_t payload_len) {
    return Header(op, flags, payload_len, group, seq, id).pack();
}

} // namespace mcumgr

#pragma once

/**
 * @page mcumgr-console-framing SMP Console Framing
 * @file console_framing.hpp
 * @brief Line-based framing that carries SMP packets over a text console UART.
 *
 * @details
 * OVERVIEW
 * --------
 * Devices that share one UART between their shell and the management agent
 * cannot accept raw binary. SMP packets are therefore wrapped into printable
 * lines the shell ignores:
 *
 *   packet  = SMP header + CBOR body
 *   body    = len16 (big-endian, counts packet + crc) | packet | crc16 (big-endian)
 *   text    = base64(body)
 *   lines   = text split into pieces of at most 124 characters, each written as
 *             <marker><piece>\n
 *
 * The first line of a frame starts with 0x06 0x09; every continuation line
 * starts with 0x04 0x14. A line is at most 127 bytes including marker and
 * newline. 124 is a multiple of 4, so every line decodes on its own.
 *
 * CRC
 * ---
 * CRC-16/CCITT with polynomial 0x1021, initial value 0, no reflection, computed
 * over the packet only.
 *
 * DECODING RULES
 * --------------
 * - Bytes are fed one at a time. Lines that do not begin with a marker are
 *   console chatter and are skipped up to their newline.
 * - A start marker always begins a fresh frame and drops any partial one.
 * - A continuation marker without a frame in progress is skipped.
 * - Bad base64, a length shorter than the CRC, or a CRC mismatch drop the frame.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> wire;
 *   mcumgr::console::encode(packet.data(), packet.size(), wire);
 *
 *   mcumgr::console::decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : incoming) {
 *       if (dec.feed(b, frame)) handle(frame);
 *   }
 * @endcode
 */

#include <algorithm>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

namespace mcumgr {
namespace console {

/** @name Line markers and limits
 *  @{ */
static constexpr uint8_t START_1 = 0x06;
static constexpr uint8_t START_2 = 0x09;
static constexpr uint8_t CONT_1  = 0x04;
static constexpr uint8_t CONT_2  = 0x14;

/// Longest line on the wire, marker and newline included.
static constexpr std::size_t LINE_MAX = 127;

/// Base64 characters per line.
static constexpr std::size_t LINE_TEXT_MAX = LINE_MAX - 3;
/** @} */

/// CRC-16/CCITT, poly 0x1021, init 0.
inline uint16_t crc16(const uint8_t* data, std::size_t n, uint16_t crc = 0) {
    for (std::size_t i = 0; i < n; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int b = 0; b < 8; ++b) {
            if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            else              crc = static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

namespace detail {

static const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

inline int base64_index(uint8_t c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace detail

/// Standard padded base64.
inline std::string base64_encode(const uint8_t* in, std::size_t n) {
    std::string out;
    out.reserve(((n + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < n; i += 3) {
        const uint32_t x = (uint32_t(in[i]) << 16) | (uint32_t(in[i + 1]) << 8) | in[i + 2];
        out.push_back(detail::BASE64_ALPHABET[(x >> 18) & 0x3F]);
        out.push_back(detail::BASE64_ALPHABET[(x >> 12) & 0x3F]);
        out.push_back(detail::BASE64_ALPHABET[(x >> 6) & 0x3F]);
        out.push_back(detail::BASE64_ALPHABET[x & 0x3F]);
    }
    if (i < n) {
        uint32_t x = uint32_t(in[i]) << 16;
        if (i + 1 < n) x |= uint32_t(in[i + 1]) << 8;
        out.push_back(detail::BASE64_ALPHABET[(x >> 18) & 0x3F]);
        out.push_back(detail::BASE64_ALPHABET[(x >> 12) & 0x3F]);
        out.push_back(i + 1 < n ? detail::BASE64_ALPHABET[(x >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

/**
 * @brief Decode padded base64, appending to @p out.
 * @return false on a length that is not a multiple of 4, a foreign character,
 *         or padding anywhere but the tail.
 */
inline bool base64_decode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    if (n % 4 != 0) return false;
    for (std::size_t i = 0; i < n; i += 4) {
        const bool last = (i + 4 == n);
        int v[4];
        int pad = 0;
        for (int j = 0; j < 4; ++j) {
            const uint8_t c = in[i + j];
            if (c == '=') {
                if (!last || j < 2) return false;
                v[j] = 0;
                ++pad;
                continue;
            }
            if (pad) return false;          // data after padding
            v[j] = detail::base64_index(c);
            if (v[j] < 0) return false;
        }
        const uint32_t x = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                           (uint32_t(v[2]) << 6) | uint32_t(v[3]);
        out.push_back(static_cast<uint8_t>(x >> 16));
        if (pad < 2) out.push_back(static_cast<uint8_t>(x >> 8));
        if (pad < 1) out.push_back(static_cast<uint8_t>(x));
    }
    return true;
}

/**
 * @brief Wrap one SMP packet into console lines.
 *
 * @param in  Packet bytes (header + CBOR body).
 * @param n   Packet length. Must leave room for the CRC inside a 16-bit length.
 * @param out Receives the lines, newline-terminated. Cleared first.
 * @return false when the packet is too long for the 16-bit length field.
 */
inline bool encode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    out.clear();
    if (n + 2 > 0xFFFF) return false;

    std::vector<uint8_t> body;
    body.reserve(n + 4);
    const uint16_t len = static_cast<uint16_t>(n + 2);
    body.push_back(static_cast<uint8_t>(len >> 8));
    body.push_back(static_cast<uint8_t>(len & 0xFF));
    body.insert(body.end(), in, in + n);
    const uint16_t crc = crc16(in, n);
    body.push_back(static_cast<uint8_t>(crc >> 8));
    body.push_back(static_cast<uint8_t>(crc & 0xFF));

    const std::string text = base64_encode(body.data(), body.size());
    out.reserve(text.size() + (text.size() / LINE_TEXT_MAX + 1) * 3);

    for (std::size_t pos = 0; pos < text.size(); pos += LINE_TEXT_MAX) {
        out.push_back(pos == 0 ? START_1 : CONT_1);
        out.push_back(pos == 0 ? START_2 : CONT_2);
        const std::size_t take = std::min(LINE_TEXT_MAX, text.size() - pos);
        out.insert(out.end(), text.begin() + pos, text.begin() + pos + take);
        out.push_back('\n');
    }
    return true;
}

/**
 * @brief Stateful console-frame decoder for byte-at-a-time feeds.
 *
 * Tracks the current line and the frame being assembled across lines.
 * Chatter and broken frames are dropped; the decoder resynchronises on the
 * next start marker.
 */
struct decoder {
    enum class LineKind : uint8_t { Unknown, Start, Cont, Skip };

    std::vector<uint8_t> line;      ///< base64 text of the current line
    std::vector<uint8_t> body;      ///< decoded bytes of the current frame
    LineKind kind = LineKind::Unknown;
    uint8_t  first = 0;             ///< first byte of the line while the marker is unresolved
    bool     have_first = false;
    bool     in_frame = false;
    uint16_t expected = 0;          ///< packet + crc length, from the frame's first two bytes

    void reset() {
        line.clear();
        body.clear();
        kind = LineKind::Unknown;
        have_first = false;
        in_frame = false;
        expected = 0;
    }

    /**
     * @brief Feed one byte; true when @p frame holds a complete, CRC-checked packet.
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == '\n') {
            const LineKind k = kind;
            kind = LineKind::Unknown;
            have_first = false;
            if (k != LineKind::Start && k != LineKind::Cont) { line.clear(); return false; }
            return end_line(frame);
        }

        switch (kind) {
            case LineKind::Skip:
                return false;
            case LineKind::Start:
            case LineKind::Cont:
                if (b == '\r') return false;
                line.push_back(b);
                if (line.size() > LINE_TEXT_MAX) drop();   // overlong line
                return false;
            case LineKind::Unknown:
                break;
        }

        if (!have_first) {
            if (b == START_1 || b == CONT_1) { first = b; have_first = true; }
            else kind = LineKind::Skip;
            return false;
        }

        have_first = false;
        line.clear();
        if (first == START_1 && b == START_2) {
            body.clear();
            in_frame = true;
            expected = 0;
            kind = LineKind::Start;
        } else if (first == CONT_1 && b == CONT_2 && in_frame) {
            kind = LineKind::Cont;
        } else {
            kind = LineKind::Skip;
        }
        return false;
    }

private:
    void drop() {
        line.clear();
        body.clear();
        in_frame = false;
        expected = 0;
        kind = LineKind::Skip;
    }

    bool end_line(std::vector<uint8_t>& frame) {
        if (!in_frame) { line.clear(); return false; }
        if (!base64_decode(line.data(), line.size(), body)) { drop(); kind = LineKind::Unknown; return false; }
        line.clear();

        if (expected == 0) {
            if (body.size() < 2) return false;
            expected = static_cast<uint16_t>((body[0] << 8) | body[1]);
            if (expected < 2) { drop(); kind = LineKind::Unknown; return false; }
        }
        if (body.size() < std::size_t(expected) + 2) return false;   // more lines follow

        bool ok = body.size() == std::size_t(expected) + 2;
        if (ok) {
            const uint8_t* pkt = body.data() + 2;
            const std::size_t n = expected - 2;
            const uint16_t crc = static_cast<uint16_t>((pkt[n] << 8) | pkt[n + 1]);
            ok = crc16(pkt, n) == crc;
            if (ok) frame.assign(pkt, pkt + n);
        }
        body.clear();
        in_frame = false;
        expected = 0;
        return ok;
    }
};

} // namespace console
} // namespace mcumgr

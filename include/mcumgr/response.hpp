/**
 * @file response.hpp
 * @brief Typed SMP response: header + decoded CBOR body, per transport scheme.
 *
 * @details
 * A `Response` is built once per received packet and never changes after.
 * The builders either hand back a fully decoded object or an error; a half
 * parsed response never reaches a caller.
 *
 * Standard and CoAP framing carry different facts, so the frame part is a
 * variant:
 *   - `StandardFrame` : the 8-byte header that arrived in front of the body.
 *   - `CoapFrame`     : the CoAP response code (class*100 + detail) and, when
 *                       the transport supplied it, the SMP header bytes that
 *                       CoAP carries inside the body's `_h` field.
 *
 * ## Return codes
 * Most bodies carry `rc`. Absent means 0 (success). SMP v2 devices may report
 * `err: {group, rc}` instead; both land in `rc()`, with the group kept in
 * `rc_group()`.
 *
 * ## Typical flow
 * @code
 * mcumgr::Response rsp;
 * mcumgr::Error e = mcumgr::Response::build_standard(Scheme::Standard, bytes, rsp);
 * if (!e.ok()) return e;
 * if (!rsp.is_success()) ... rsp.return_code() ...
 * @endcode
 */
#ifndef MCUMGR_RESPONSE_HPP
#define MCUMGR_RESPONSE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "mcumgr/error.hpp"
#include "mcumgr/header.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/scheme.hpp"

namespace mcumgr {

/// Device return codes (`rc`). Values above PER_USER are group specific.
enum class ReturnCode : int {
  Ok                = 0,
  Unknown           = 1,
  NoMemory          = 2,
  InValue           = 3,
  Timeout           = 4,
  NoEntry           = 5,
  BadState          = 6,
  TooLarge          = 7,
  NotSupported      = 8,
  Corrupt           = 9,
  Busy              = 10,
  AccessDenied      = 11,
  UnsupportedTooOld = 12,
  UnsupportedTooNew = 13,
  PerUser           = 256
};

/// Name of a return code for diagnostics ("no_entry", "per_user+3", ...).
std::string return_code_name(int rc);

struct StandardFrame {
  Header header;
};

struct CoapFrame {
  std::optional<Header> header;
  int code{0};   ///< class*100 + detail, e.g. 205 for 2.05 Content
};

class Response {
public:
  Response() = default;

  /**
   * @brief Build from a standard-scheme packet (8-byte header + CBOR body).
   * @return `IoDecodeError` for a CoAP @p scheme, fewer than 8 bytes, or a
   *         header `len` other than the number of bytes after the header;
   *         `MalformedHeader` / `PayloadDecodeError` from the codecs.
   */
  static Error build_standard(Scheme scheme, const Bytes& bytes, Response& out);

  /**
   * @brief Build from a CoAP reply the transport has already taken apart.
   * @param bytes       whole packet including the CoAP header
   * @param header      SMP header bytes from the `_h` field; may be empty
   * @param body        CBOR body
   * @param code_class  CoAP code class (2 success, 4 client error, 5 server error)
   * @param code_detail CoAP code detail
   * @return `CoapError{class*100+detail}` for classes 4 and 5, before any
   *         body decoding is attempted.
   */
  static Error build_coap(Scheme scheme, const Bytes& bytes, const Bytes& header,
                          const Bytes& body, int code_class, int code_detail,
                          Response& out);

  /**
   * @brief Total packet size announced by a header at the front of @p data.
   *
   * Stream transports call this after the first 8 bytes arrive to learn how
   * many more bytes to buffer before a full decode.
   *
   * @return `UnsupportedForScheme` for CoAP; `IoDecodeError` when fewer than 8
   *         bytes are present or the header does not parse.
   */
  static Error expected_length(Scheme scheme, const uint8_t* data, std::size_t n,
                               std::size_t& out);

  Scheme          scheme()  const { return scheme_; }
  const Bytes&    bytes()   const { return bytes_; }
  const Bytes&    payload() const { return payload_; }
  const Document& body()    const { return body_; }

  /// Header for standard responses, and for CoAP responses that carried one.
  std::optional<Header> header() const;

  /// CoAP response code, 0 for standard schemes.
  int coap_code() const;

  int        rc()          const { return rc_; }
  uint16_t   rc_group()    const { return rc_group_; }
  ReturnCode return_code() const { return static_cast<ReturnCode>(rc_); }
  bool       is_success()  const { return rc_ == 0; }

  /// Body rendered as JSON text.
  std::string to_string() const;

  const std::variant<StandardFrame, CoapFrame>& frame() const { return frame_; }

private:
  /// Decode @p body and pull `rc` / `err`; fills everything but the frame.
  static Error decode_body(Scheme scheme, const Bytes& bytes, const Bytes& body, Response& r);

  Scheme   scheme_{Scheme::Standard};
  Bytes    bytes_;
  Bytes    payload_;
  Document body_ = Document::object();
  int      rc_{0};
  uint16_t rc_group_{0};
  std::variant<StandardFrame, CoapFrame> frame_;
};

} // namespace mcumgr

#endif // MCUMGR_RESPONSE_HPP

#pragma once
/**
 * @file error.hpp
 * @brief Result codes shared by every mcumgr layer (codecs, client, transfers).
 *
 * Nothing in the public API throws. Operations return an `Error` value and
 * write their product into a caller-owned out-parameter, the same way the
 * transport layer reports `SendResult`. An `Error` with code `Ok` is success.
 *
 * Classification matters in exactly one place: the transfer chunk loop retries
 * codes for which `is_transient()` is true and fails the session on the rest.
 */

#include <cstdint>

namespace mcumgr {

enum class ErrorCode : uint8_t {
  Ok = 0,
  MalformedHeader,        ///< header shorter than 8 bytes or reserved op
  PayloadDecodeError,     ///< CBOR truncated, malformed, or field of wrong type
  IoDecodeError,          ///< wrong builder for the scheme, or packet shorter than a header
  UnsupportedForScheme,   ///< operation has no meaning for CoAP framing
  CoapError,              ///< peer answered with CoAP class 4.xx / 5.xx; value = class*100+detail
  TransportTimeout,       ///< no reply within the transport's timeout
  TransportDisconnected,  ///< link dropped while the exchange was pending
  TransportBusy,          ///< transport already serving another caller
  TransportError,         ///< any other transport failure
  SequenceMismatch,       ///< reply belongs to an earlier request (stale)
  NonZeroReturnCode,      ///< device executed the command and reported rc != 0; value = rc
  MtuTooSmall,            ///< no room for a single data byte in one packet
  AlreadyInProgress,      ///< start() while a session exists
  NotInProgress           ///< pause/resume/cancel from a state that does not allow it
};

/**
 * @brief Result of an operation: a code plus one integer of context.
 *
 * `value` carries the CoAP code for `CoapError`, the device return code for
 * `NonZeroReturnCode`, and is 0 otherwise. `group` is set when an SMP v2
 * reply names the command group that produced the return code.
 */
struct Error {
  ErrorCode code{ErrorCode::Ok};
  int       value{0};
  uint16_t  group{0};

  Error() = default;
  Error(ErrorCode c, int v = 0, uint16_t g = 0) : code(c), value(v), group(g) {}

  bool ok() const { return code == ErrorCode::Ok; }
  bool operator==(ErrorCode c) const { return code == c; }
  bool operator!=(ErrorCode c) const { return code != c; }
};

/// Stable lowercase token for logs and CLI status lines ("coap_error", ...).
const char* to_string(ErrorCode code);

/// True for failures worth retrying on the same chunk.
bool is_transient(ErrorCode code);

} // namespace mcumgr

#include "mcumgr/error.hpp"

namespace mcumgr {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                    return "ok";
    case ErrorCode::MalformedHeader:       return "malformed_header";
    case ErrorCode::PayloadDecodeError:    return "payload_decode_error";
    case ErrorCode::IoDecodeError:         return "io_decode_error";
    case ErrorCode::UnsupportedForScheme:  return "unsupported_for_scheme";
    case ErrorCode::CoapError:             return "coap_error";
    case ErrorCode::TransportTimeout:      return "timeout";
    case ErrorCode::TransportDisconnected: return "disconnected";
    case ErrorCode::TransportBusy:         return "busy";
    case ErrorCode::TransportError:        return "transport_error";
    case ErrorCode::SequenceMismatch:      return "sequence_mismatch";
    case ErrorCode::NonZeroReturnCode:     return "rc";
    case ErrorCode::MtuTooSmall:           return "mtu_too_small";
    case ErrorCode::AlreadyInProgress:     return "already_in_progress";
    case ErrorCode::NotInProgress:         return "not_in_progress";
  }
  return "unknown";
}

bool is_transient(ErrorCode code) {
  return code == ErrorCode::TransportTimeout
      || code == ErrorCode::TransportDisconnected
      || code == ErrorCode::SequenceMismatch;
}

} // namespace mcumgr

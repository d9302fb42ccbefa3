#pragma once
/**
 * @file scheme.hpp
 * @brief Which framing a transport speaks: the plain 8-byte SMP header, or CoAP.
 */

#include <cstdint>

namespace mcumgr {

enum class Scheme : uint8_t {
  Standard    = 0,  ///< serial / UART console, length-prefixed
  StandardBle = 1,  ///< BLE GATT characteristic, header-delimited
  CoapBle     = 2,
  CoapUdp     = 3
};

inline bool is_coap(Scheme s) {
  return s == Scheme::CoapBle || s == Scheme::CoapUdp;
}

inline const char* to_string(Scheme s) {
  switch (s) {
    case Scheme::Standard:    return "standard";
    case Scheme::StandardBle: return "ble";
    case Scheme::CoapBle:     return "coap-ble";
    case Scheme::CoapUdp:     return "coap-udp";
  }
  return "unknown";
}

} // namespace mcumgr

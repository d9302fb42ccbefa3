#pragma once
/**
 * @file payload.hpp
 * @brief CBOR payload codec for SMP request and response bodies.
 *
 * @details
 * Every SMP body is a CBOR map. The in-memory form is `Document`, an
 * insertion-ordered nlohmann JSON value: a closed set of tagged types
 * (integer, float, byte string, text, bool, null, map, array). Byte strings
 * map to the JSON `binary` type so file data survives unchanged.
 *
 * Forward compatibility: decode never rejects unknown keys. Devices add
 * fields over time; callers read what they know and ignore the rest.
 *
 * No exceptions leave this module. The CBOR reader runs in non-throwing
 * mode and every failure comes back as `PayloadDecodeError`.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mcumgr/error.hpp"

namespace mcumgr {

using Document = nlohmann::ordered_json;
using Bytes    = std::vector<uint8_t>;

namespace payload {

/// An empty map, the body of commands that take no arguments.
inline Document empty() { return Document::object(); }

/// Wrap raw bytes so they encode as a CBOR byte string.
inline Document bytes(const uint8_t* data, std::size_t n) {
  return Document::binary(Bytes(data, data + n));
}

/// Encode @p doc as CBOR.
Bytes encode(const Document& doc);

/**
 * @brief Decode a CBOR map.
 * @return `PayloadDecodeError` on truncated/malformed input or when the
 *         top-level item is not a map. An empty buffer decodes to `{}`.
 */
Error decode(const uint8_t* data, std::size_t n, Document& out);

inline Error decode(const Bytes& in, Document& out) { return decode(in.data(), in.size(), out); }

/// True when @p doc is a map containing @p key.
bool has(const Document& doc, const char* key);

/// @name Typed field readers
/// Absent key: Ok, @p out untouched. Present with the wrong type: PayloadDecodeError.
///@{
Error get_int  (const Document& doc, const char* key, int64_t& out);
Error get_bool (const Document& doc, const char* key, bool& out);
Error get_text (const Document& doc, const char* key, std::string& out);
Error get_bytes(const Document& doc, const char* key, Bytes& out);
///@}

/// Size in bytes of the CBOR head for a byte string of @p n bytes.
std::size_t bstr_head_size(std::size_t n);

} // namespace payload
} // namespace mcumgr

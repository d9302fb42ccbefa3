#include "mcumgr/payload.hpp"

namespace mcumgr {
namespace payload {

Bytes encode(const Document& doc) {
    return Document::to_cbor(doc);
}

Error decode(const uint8_t* data, std::size_t n, Document& out) {
    // An SMP reply may legitimately carry no body at all.
    if (n == 0) { out = Document::object(); return Error(); }
    if (data == nullptr) return Error(ErrorCode::PayloadDecodeError);

    // strict=true rejects trailing bytes; allow_exceptions=false hands back a
    // discarded value instead of throwing. Unknown tags are skipped.
    Document doc = Document::from_cbor(data, data + n, true, false,
                                       Document::cbor_tag_handler_t::ignore);
    if (doc.is_discarded() || !doc.is_object()) return Error(ErrorCode::PayloadDecodeError);

    out = std::move(doc);
    return Error();
}

bool has(const Document& doc, const char* key) {
    return doc.is_object() && doc.contains(key);
}

Error get_int(const Document& doc, const char* key, int64_t& out) {
    if (!has(doc, key)) return Error();
    const Document& v = doc[key];
    if (!v.is_number_integer()) return Error(ErrorCode::PayloadDecodeError);
    out = v.get<int64_t>();
    return Error();
}

Error get_bool(const Document& doc, const char* key, bool& out) {
    if (!has(doc, key)) return Error();
    const Document& v = doc[key];
    if (!v.is_boolean()) return Error(ErrorCode::PayloadDecodeError);
    out = v.get<bool>();
    return Error();
}

Error get_text(const Document& doc, const char* key, std::string& out) {
    if (!has(doc, key)) return Error();
    const Document& v = doc[key];
    if (!v.is_string()) return Error(ErrorCode::PayloadDecodeError);
    out = v.get<std::string>();
    return Error();
}

Error get_bytes(const Document& doc, const char* key, Bytes& out) {
    if (!has(doc, key)) return Error();
    const Document& v = doc[key];
    if (!v.is_binary()) return Error(ErrorCode::PayloadDecodeError);
    const auto& bin = v.get_binary();
    out.assign(bin.begin(), bin.end());
    return Error();
}

std::size_t bstr_head_size(std::size_t n) {
    if (n < 24)       return 1;
    if (n <= 0xFF)    return 2;
    if (n <= 0xFFFF)  return 3;
    if (n <= 0xFFFFFFFFu) return 5;
    return 9;
}

} // namespace payload
} // namespace mcumgr

/**
 * @file response.cpp
 * @brief Scheme-aware response construction and return-code interpretation.
 *
 * All builders assemble into a local `Response` and copy it out only once
 * every step succeeded, so a caller's object is never left half filled.
 */
#include "mcumgr/response.hpp"

namespace mcumgr {

std::string return_code_name(int rc) {
    switch (static_cast<ReturnCode>(rc)) {
        case ReturnCode::Ok:                return "ok";
        case ReturnCode::Unknown:           return "unknown";
        case ReturnCode::NoMemory:          return "no_memory";
        case ReturnCode::InValue:           return "in_value";
        case ReturnCode::Timeout:           return "timeout";
        case ReturnCode::NoEntry:           return "no_entry";
        case ReturnCode::BadState:          return "bad_state";
        case ReturnCode::TooLarge:          return "too_large";
        case ReturnCode::NotSupported:      return "not_supported";
        case ReturnCode::Corrupt:           return "corrupt";
        case ReturnCode::Busy:              return "busy";
        case ReturnCode::AccessDenied:      return "access_denied";
        case ReturnCode::UnsupportedTooOld: return "unsupported_too_old";
        case ReturnCode::UnsupportedTooNew: return "unsupported_too_new";
        case ReturnCode::PerUser:           return "per_user";
    }
    if (rc > static_cast<int>(ReturnCode::PerUser))
        return "per_user+" + std::to_string(rc - static_cast<int>(ReturnCode::PerUser));
    return "rc_" + std::to_string(rc);
}

// ---------------------------------------------------------------------------
// decode_body()
// -------------
// Shared tail of both builders: CBOR body -> document -> rc.
// "rc" wins when a device sends both "rc" and an SMP v2 "err" map.
// ---------------------------------------------------------------------------
Error Response::decode_body(Scheme scheme, const Bytes& bytes, const Bytes& body, Response& r) {
    Document doc;
    Error e = payload::decode(body, doc);
    if (!e.ok()) return e;

    int64_t rc = 0;
    int64_t group = 0;
    if (payload::has(doc, "rc")) {
        e = payload::get_int(doc, "rc", rc);
        if (!e.ok()) return e;
    } else if (payload::has(doc, "err")) {
        const Document& err = doc["err"];
        if (!err.is_object()) return Error(ErrorCode::PayloadDecodeError);
        e = payload::get_int(err, "rc", rc);
        if (!e.ok()) return e;
        e = payload::get_int(err, "group", group);
        if (!e.ok()) return e;
    }

    r.scheme_   = scheme;
    r.bytes_    = bytes;
    r.payload_  = body;
    r.body_     = std::move(doc);
    r.rc_       = static_cast<int>(rc);
    r.rc_group_ = static_cast<uint16_t>(group);
    return Error();
}

Error Response::build_standard(Scheme scheme, const Bytes& bytes, Response& out) {
    if (is_coap(scheme))              return Error(ErrorCode::IoDecodeError);
    if (bytes.size() < HEADER_LENGTH) return Error(ErrorCode::IoDecodeError);

    Header h;
    Error e = Header::decode(bytes.data(), bytes.size(), h);
    if (!e.ok()) return e;

    // The header's len must account for exactly the bytes after it
    if (bytes.size() != HEADER_LENGTH + h.len) return Error(ErrorCode::IoDecodeError);

    Bytes body(bytes.begin() + HEADER_LENGTH, bytes.end());

    Response r;
    e = decode_body(scheme, bytes, body, r);
    if (!e.ok()) return e;
    r.frame_ = StandardFrame{h};

    out = std::move(r);
    return Error();
}

Error Response::build_coap(Scheme scheme, const Bytes& bytes, const Bytes& header,
                           const Bytes& body, int code_class, int code_detail,
                           Response& out) {
    const int code = code_class * 100 + code_detail;

    // 4.xx / 5.xx: the exchange failed; the body is not ours to interpret.
    if (code_class == 4 || code_class == 5) return Error(ErrorCode::CoapError, code);

    CoapFrame frame;
    frame.code = code;
    if (!header.empty()) {
        Header h;
        Error e = Header::decode(header.data(), header.size(), h);
        if (!e.ok()) return e;
        frame.header = h;
    }

    Response r;
    Error e = decode_body(scheme, bytes, body, r);
    if (!e.ok()) return e;
    r.frame_ = frame;

    out = std::move(r);
    return Error();
}

Error Response::expected_length(Scheme scheme, const uint8_t* data, std::size_t n,
                                std::size_t& out) {
    if (is_coap(scheme))     return Error(ErrorCode::UnsupportedForScheme);
    if (n < HEADER_LENGTH)   return Error(ErrorCode::IoDecodeError);

    Header h;
    if (!Header::decode(data, n, h).ok()) return Error(ErrorCode::IoDecodeError);

    out = static_cast<std::size_t>(h.len) + HEADER_LENGTH;
    return Error();
}

std::optional<Header> Response::header() const {
    if (const auto* s = std::get_if<StandardFrame>(&frame_)) return s->header;
    return std::get<CoapFrame>(frame_).header;
}

int Response::coap_code() const {
    if (const auto* c = std::get_if<CoapFrame>(&frame_)) return c->code;
    return 0;
}

std::string Response::to_string() const {
    return body_.dump();
}

} // namespace mcumgr

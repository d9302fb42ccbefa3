// ============================================================================
// client.cpp : implementation for client.hpp
// ============================================================================
#include "mcumgr/client.hpp"

namespace mcumgr {

using transport::RawReply;
using transport::SendResult;

static Error from_send_result(SendResult r) {
    switch (r) {
        case SendResult::Ok:           return Error();
        case SendResult::Timeout:      return Error(ErrorCode::TransportTimeout);
        case SendResult::Disconnected: return Error(ErrorCode::TransportDisconnected);
        case SendResult::Busy:         return Error(ErrorCode::TransportBusy);
        case SendResult::Error:        break;
    }
    return Error(ErrorCode::TransportError);
}

bool encode_request(Op op, uint16_t group, uint8_t seq, uint8_t id,
                    const Document& body, Bytes& out) {
    Bytes cbor = payload::encode(body);
    if (cbor.size() > 0xFFFF) return false;

    HeaderBytes h = encode_header(op, 0, group, seq, id, static_cast<uint16_t>(cbor.size()));
    out.clear();
    out.reserve(HEADER_LENGTH + cbor.size());
    out.insert(out.end(), h.begin(), h.end());
    out.insert(out.end(), cbor.begin(), cbor.end());
    return true;
}

// ---------------------------------------------------------------------------
// exchange()
// ----------
// Send, pick the builder for the link's scheme, then correlate by sequence.
// CoAP replies are only checked when the link handed back the SMP header.
// ---------------------------------------------------------------------------
Error Client::exchange(const Bytes& request, uint8_t seq, Response& out) {
    RawReply reply;
    Error e = from_send_result(transport_.send(request, reply));
    if (!e.ok()) return e;

    const Scheme scheme = transport_.scheme();
    Response rsp;
    if (is_coap(scheme)) {
        e = Response::build_coap(scheme, reply.bytes, reply.header, reply.payload,
                                 reply.code_class, reply.code_detail, rsp);
    } else {
        e = Response::build_standard(scheme, reply.bytes, rsp);
    }
    if (!e.ok()) return e;

    std::optional<Header> h = rsp.header();
    if (h && h->seq != seq) return Error(ErrorCode::SequenceMismatch);

    out = std::move(rsp);
    if (!out.is_success()) return Error(ErrorCode::NonZeroReturnCode, out.rc(), out.rc_group());
    return Error();
}

Error Client::execute(Op op, uint16_t group, uint8_t id, const Document& body, Response& out) {
    const uint8_t seq = seq_.fetch_add(1);

    Bytes request;
    if (!encode_request(op, group, seq, id, body, request)) return Error(ErrorCode::MtuTooSmall);
    if (request.size() > transport_.mtu())                 return Error(ErrorCode::MtuTooSmall);

    if (transport_.allows_concurrent_use()) return exchange(request, seq, out);

    std::unique_lock<std::mutex> lock(io_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return Error(ErrorCode::TransportBusy);
    return exchange(request, seq, out);
}

} // namespace mcumgr

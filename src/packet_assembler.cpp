#include "mcumgr/transport/packet_assembler.hpp"
#include "mcumgr/header.hpp"
#include "mcumgr/response.hpp"

namespace mcumgr::transport {

// ---------------------------------------------------------------------------
// update_expected()
// -----------------
// Learn the packet length as soon as the header is complete. Returns false
// when the header is garbage; the stream cannot be resynchronised from inside
// a packet, so the whole buffer goes.
// ---------------------------------------------------------------------------
bool PacketAssembler::update_expected() {
    if (expected_ != 0 || buf_.size() < HEADER_LENGTH) return true;

    std::size_t len = 0;
    Error e = Response::expected_length(scheme_, buf_.data(), buf_.size(), len);
    if (!e.ok()) {
        last_error_ = e;
        buf_.clear();
        expected_ = 0;
        return false;
    }
    expected_ = len;
    return true;
}

bool PacketAssembler::feed(const uint8_t* data, std::size_t n) {
    if (data && n) buf_.insert(buf_.end(), data, data + n);
    if (!update_expected()) return false;
    return expected_ != 0 && buf_.size() >= expected_;
}

bool PacketAssembler::pop(std::vector<uint8_t>& out) {
    if (expected_ == 0 || buf_.size() < expected_) return false;

    out.assign(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(expected_));
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(expected_));
    expected_ = 0;
    update_expected();   // leftover bytes may already hold the next header
    return true;
}

std::size_t PacketAssembler::missing() const {
    if (expected_ == 0 || buf_.size() >= expected_) return 0;
    return expected_ - buf_.size();
}

} // namespace mcumgr::transport

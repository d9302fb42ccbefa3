#include "commands.hpp"   // Our own header: group/command ids, builders, decode API

#include <sstream>        // std::ostringstream: assemble decode_pretty summaries

namespace mcumgr {
// ============================================================================
// Request bodies
// ============================================================================
// Key names and types follow the device agent's schema. Unsigned offsets and
// lengths encode as CBOR unsigned integers.

Document make_echo(const std::string& text) {
    Document d = Document::object();
    d["d"] = text;
    return d;
}


Document make_fs_download(const std::string& name, uint32_t off) {
    Document d = Document::object();
    d["off"]  = off;
    d["name"] = name;
    return d;
}


Document make_fs_upload(const std::string& name, uint32_t off,
                        const uint8_t* data, std::size_t n, uint32_t total) {
    Document d = Document::object();
    d["off"]  = off;
    d["data"] = payload::bytes(data, n);
    if (off == 0) d["len"] = total;    // first chunk announces the file size
    d["name"] = name;
    return d;
}


Document make_image_upload(uint8_t image, uint32_t off,
                           const uint8_t* data, std::size_t n, uint32_t total) {
    Document d = Document::object();
    if (off == 0 && image != 0) d["image"] = image;   // slot 0 is the default
    d["off"]  = off;
    d["data"] = payload::bytes(data, n);
    if (off == 0) d["len"] = total;
    return d;
}

// ============================================================================
// Simple commands
// ============================================================================

Error echo(Client& client, const std::string& text, std::string& reply) {
    Response rsp;
    Error e = client.execute(Op::Write, GROUP_DEFAULT, DEFAULT_ECHO, make_echo(text), rsp);
    if (!e.ok()) return e;

    std::string r;
    e = payload::get_text(rsp.body(), "r", r);
    if (!e.ok()) return e;
    reply = r;
    return Error();
}


Error reset(Client& client) {
    Response rsp;
    return client.execute(Op::Write, GROUP_DEFAULT, DEFAULT_RESET, payload::empty(), rsp);
}

// ============================================================================
// Rendering
// ============================================================================

std::string decode_pretty(const Response& rsp) {
    std::ostringstream os;
    os << "status=" << (rsp.is_success() ? "ok" : "error");

    if (auto h = rsp.header()) {
        os << " seq=" << static_cast<unsigned>(h->seq)
           << " group=" << h->group
           << " id=" << static_cast<unsigned>(h->id);
    }
    if (is_coap(rsp.scheme())) os << " coap=" << rsp.coap_code();
    if (!rsp.is_success())     os << " rc=" << return_code_name(rsp.rc());

    for (auto it = rsp.body().begin(); it != rsp.body().end(); ++it) {
        if (it.key() == "rc" || it.key() == "err") continue;   // already shown
        os << ' ' << it.key() << '=';
        const Document& v = it.value();
        if (v.is_binary())      os << '<' << v.get_binary().size() << " bytes>";
        else if (v.is_string()) os << v.get<std::string>();
        else                    os << v.dump();
    }
    return os.str();
}

} // namespace mcumgr

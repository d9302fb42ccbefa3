#include <doctest/doctest.h>
#include "mcumgr/header.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/transport/packet_assembler.hpp"

using namespace mcumgr;
using mcumgr::transport::PacketAssembler;

static Bytes reply_packet(uint8_t seq, std::size_t data_len) {
    Bytes data(data_len, 0x5A);
    Document body = Document::object();
    body["off"] = 0;
    body["data"] = payload::bytes(data.data(), data.size());
    Bytes cbor = payload::encode(body);
    HeaderBytes h = encode_header(Op::ReadResponse, 0, 8, seq, 0, static_cast<uint16_t>(cbor.size()));
    Bytes out(h.begin(), h.end());
    out.insert(out.end(), cbor.begin(), cbor.end());
    return out;
}

TEST_CASE("Fragments are buffered until the announced length arrives") {
    Bytes pkt = reply_packet(1, 100);
    PacketAssembler pa;

    CHECK_FALSE(pa.feed(pkt.data(), 5));
    CHECK(pa.missing() == 0);                       // header incomplete, length unknown
    CHECK_FALSE(pa.feed(pkt.data() + 5, 20));
    CHECK(pa.missing() == pkt.size() - 25);
    CHECK(pa.feed(pkt.data() + 25, pkt.size() - 25));

    Bytes out;
    REQUIRE(pa.pop(out));
    CHECK(out == pkt);
    CHECK_FALSE(pa.pop(out));
}

TEST_CASE("Back-to-back packets in one read come out one at a time") {
    Bytes a = reply_packet(1, 10);
    Bytes b = reply_packet(2, 30);
    Bytes both = a;
    both.insert(both.end(), b.begin(), b.end());

    PacketAssembler pa(Scheme::Standard);
    REQUIRE(pa.feed(both.data(), both.size()));

    Bytes out;
    REQUIRE(pa.pop(out));
    CHECK(out == a);
    REQUIRE(pa.pop(out));
    CHECK(out == b);
    CHECK_FALSE(pa.pop(out));
}

TEST_CASE("A garbage header drops the buffer and reports why") {
    Bytes junk(8, 0x07);
    PacketAssembler pa;
    CHECK_FALSE(pa.feed(junk.data(), junk.size()));
    CHECK(pa.last_error() == ErrorCode::IoDecodeError);

    Bytes pkt = reply_packet(3, 4);
    pa.reset();
    REQUIRE(pa.feed(pkt.data(), pkt.size()));
    Bytes out;
    REQUIRE(pa.pop(out));
    CHECK(out == pkt);
}

TEST_CASE("CoAP links cannot use stream reassembly") {
    Bytes pkt = reply_packet(1, 4);
    PacketAssembler pa(Scheme::CoapUdp);
    CHECK_FALSE(pa.feed(pkt.data(), pkt.size()));
    CHECK(pa.last_error() == ErrorCode::UnsupportedForScheme);
}

#include <doctest/doctest.h>
#include "mcumgr/image_upload.hpp"
#include "mock_transport.hpp"

using namespace mcumgr;
using namespace mcumgr::test;

TEST_CASE("Image upload writes to the image group and names a non-default slot once") {
    const Bytes image = pattern(700);
    Bytes device;
    ScriptedTransport link(200);
    link.set_fallback(accept_upload(device));
    Client client(link);
    EventLog log;
    RecordingUpload obs(log);
    ImageUploader up(client, obs);

    REQUIRE(up.start(1, image).ok());
    up.wait();

    CHECK(log.completed_count() == 1);
    CHECK(device == image);

    auto seen = link.seen();
    REQUIRE(seen.size() > 1);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        CHECK(seen[i].header.op == Op::Write);
        CHECK(seen[i].header.group == 1);
        CHECK(seen[i].header.id == 1);
        CHECK(seen[i].body.contains("image") == (i == 0));
        CHECK(seen[i].body.contains("len") == (i == 0));
        CHECK_FALSE(seen[i].body.contains("name"));
    }
    CHECK(seen[0].body["image"].get<int>() == 1);
    CHECK(seen[0].body["len"].get<uint32_t>() == 700);
}

TEST_CASE("The default image slot is not sent") {
    Bytes device;
    ScriptedTransport link(200);
    link.set_fallback(accept_upload(device));
    Client client(link);
    EventLog log;
    RecordingUpload obs(log);
    ImageUploader up(client, obs);

    REQUIRE(up.start(0, pattern(50)).ok());
    up.wait();
    CHECK(log.completed_count() == 1);
    CHECK_FALSE(link.seen()[0].body.contains("image"));
}

TEST_CASE("Image upload survives a dropped link within the retry budget") {
    const Bytes image = pattern(400);
    Bytes device;
    ScriptedTransport link(200);
    auto accept = accept_upload(device);
    link.push(accept);
    link.push_result(SendResult::Disconnected);
    link.set_fallback(accept);
    Client client(link);
    EventLog log;
    RecordingUpload obs(log);
    ImageUploader up(client, obs);

    REQUIRE(up.start(0, image).ok());
    up.wait();
    CHECK(log.completed_count() == 1);
    CHECK(device == image);
}

TEST_CASE("Cancelling an image upload mid-way reports once and stops sending") {
    Bytes device;
    ScriptedTransport link(200);
    Client client(link);
    EventLog log;
    RecordingUpload obs(log);
    ImageUploader up(client, obs);

    auto accept = accept_upload(device);
    link.push(accept);
    link.push([&](const Seen& req, RawReply& reply) {
        CHECK(up.cancel().ok());
        return accept(req, reply);
    });
    link.set_fallback(accept);

    REQUIRE(up.start(0, pattern(2000)).ok());
    up.wait();
    CHECK(log.cancelled_count() == 1);
    CHECK(log.completed_count() == 0);
    CHECK(link.sends() == 2);
}

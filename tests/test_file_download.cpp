#include <doctest/doctest.h>
#include <chrono>
#include <condition_variable>
#include <future>
#include <thread>
#include "mcumgr/file_download.hpp"
#include "mock_transport.hpp"

using namespace mcumgr;
using namespace mcumgr::test;

static std::vector<uint32_t> request_offsets(const ScriptedTransport& link) {
    std::vector<uint32_t> offs;
    for (const Seen& s : link.seen()) offs.push_back(s.body["off"].get<uint32_t>());
    return offs;
}

TEST_CASE("A 1000-byte file arrives in 256-byte chunks with one completion") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    link.set_fallback(serve_file(file, 256));
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/lfs/data.bin").ok());
    dl.wait();

    CHECK(log.completed_count() == 1);
    CHECK(log.failed_count() == 0);
    CHECK(log.cancelled_count() == 0);
    CHECK(log.data() == file);
    CHECK(dl.state() == TransferState::Completed);

    CHECK(request_offsets(link) == std::vector<uint32_t>{0, 256, 512, 768});
    auto events = log.progress_events();
    REQUIRE(events.size() == 4);
    CHECK(events[0] == std::make_pair(256u, 1000u));
    CHECK(events[1] == std::make_pair(512u, 1000u));
    CHECK(events[2] == std::make_pair(768u, 1000u));
    CHECK(events[3] == std::make_pair(1000u, 1000u));
    CHECK(dl.progress().offset == 1000);
    CHECK(dl.progress().total == 1000);

    auto seen = link.seen();
    CHECK(seen[0].header.op == Op::Read);
    CHECK(seen[0].header.group == 8);
    CHECK(seen[0].header.id == 0);
    CHECK(seen[0].body["name"].get<std::string>() == "/lfs/data.bin");
    CHECK(link.throughput_requests() == 1);
}

TEST_CASE("Two timeouts on chunk 2 are retried and the transfer completes") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    link.push(serve_file(file, 256));
    link.push_result(SendResult::Timeout);
    link.push_result(SendResult::Timeout);
    link.set_fallback(serve_file(file, 256));
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());
    dl.wait();

    CHECK(log.completed_count() == 1);
    CHECK(log.failed_count() == 0);
    CHECK(log.data() == file);
    CHECK(request_offsets(link) == std::vector<uint32_t>{0, 256, 256, 256, 512, 768});
}

TEST_CASE("Exhausting the retry ceiling fails exactly once") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    link.push(serve_file(file, 256));   // then nothing answers
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());
    dl.wait();

    CHECK(log.failed_count() == 1);
    CHECK(log.completed_count() == 0);
    CHECK(log.cancelled_count() == 0);
    CHECK(log.error() == ErrorCode::TransportTimeout);
    CHECK(dl.last_error() == ErrorCode::TransportTimeout);
    CHECK(dl.state() == TransferState::Failed);
    CHECK(link.sends() == 1 + 1 + TransferController::RETRIES_DEFAULT);
    CHECK(dl.progress().offset == 0);
    CHECK(dl.progress().total == 0);
}

TEST_CASE("The retry ceiling is configurable") {
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    TransferConfig cfg;
    cfg.max_retries = 0;
    FileDownloader dl(client, obs, cfg);
    CHECK(dl.max_retries() == 0);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(log.failed_count() == 1);
    CHECK(link.sends() == 1);

    dl.set_max_retries(5);
    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(log.failed_count() == 2);
    CHECK(link.sends() == 1 + 6);
}

TEST_CASE("rc=1 fails the download without retrying") {
    ScriptedTransport link(300);
    link.push([](const Seen& req, RawReply& reply) {
        Document body = Document::object();
        body["rc"] = 1;
        make_reply(req.header, body, reply);
        return SendResult::Ok;
    });
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());
    dl.wait();

    CHECK(log.failed_count() == 1);
    CHECK(log.error() == ErrorCode::NonZeroReturnCode);
    CHECK(log.error().value == 1);
    CHECK(link.sends() == 1);
}

TEST_CASE("A reply for another offset is stale and retried") {
    const Bytes file = pattern(600);
    ScriptedTransport link(300);
    link.push(serve_file(file, 256));
    link.push([&file](const Seen& req, RawReply& reply) {
        Document body = Document::object();
        body["rc"] = 0;
        body["off"] = 0;                              // answers the previous request
        body["data"] = payload::bytes(file.data(), 256);
        make_reply(req.header, body, reply);
        return SendResult::Ok;
    });
    link.set_fallback(serve_file(file, 256));
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());
    dl.wait();

    CHECK(log.completed_count() == 1);
    CHECK(log.data() == file);
    CHECK(request_offsets(link) == std::vector<uint32_t>{0, 256, 256, 512});
}

TEST_CASE("Malformed download replies are fatal") {
    SUBCASE("first reply without len") {
        ScriptedTransport link(300);
        link.push([](const Seen& req, RawReply& reply) {
            Document body = Document::object();
            const uint8_t d[] = {1, 2};
            body["off"] = 0;
            body["data"] = payload::bytes(d, 2);
            make_reply(req.header, body, reply);
            return SendResult::Ok;
        });
        Client client(link);
        EventLog log;
        RecordingDownload obs(log);
        FileDownloader dl(client, obs);
        REQUIRE(dl.start("/f").ok());
        dl.wait();
        CHECK(log.failed_count() == 1);
        CHECK(log.error() == ErrorCode::PayloadDecodeError);
        CHECK(link.sends() == 1);
    }
    SUBCASE("empty data before the end") {
        ScriptedTransport link(300);
        link.push([](const Seen& req, RawReply& reply) {
            Document body = Document::object();
            body["off"] = 0;
            body["data"] = payload::bytes(nullptr, 0);
            body["len"] = 10;
            make_reply(req.header, body, reply);
            return SendResult::Ok;
        });
        Client client(link);
        EventLog log;
        RecordingDownload obs(log);
        FileDownloader dl(client, obs);
        REQUIRE(dl.start("/f").ok());
        dl.wait();
        CHECK(log.failed_count() == 1);
        CHECK(log.error() == ErrorCode::PayloadDecodeError);
    }
    SUBCASE("more data than announced") {
        ScriptedTransport link(300);
        link.push([](const Seen& req, RawReply& reply) {
            Document body = Document::object();
            const uint8_t d[8] = {};
            body["off"] = 0;
            body["data"] = payload::bytes(d, 8);
            body["len"] = 4;
            make_reply(req.header, body, reply);
            return SendResult::Ok;
        });
        Client client(link);
        EventLog log;
        RecordingDownload obs(log);
        FileDownloader dl(client, obs);
        REQUIRE(dl.start("/f").ok());
        dl.wait();
        CHECK(log.error() == ErrorCode::PayloadDecodeError);
    }
}

TEST_CASE("An empty file completes after one exchange") {
    ScriptedTransport link(300);
    link.set_fallback(serve_file(Bytes(), 256));
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/empty").ok());
    dl.wait();
    CHECK(log.completed_count() == 1);
    CHECK(log.data().empty());
    CHECK(link.sends() == 1);
}

TEST_CASE("Cancel twice during a chunk yields one cancellation") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    Error first, second;
    auto serve = serve_file(file, 256);
    link.push(serve);
    link.push([&](const Seen& req, RawReply& reply) {
        first = dl.cancel();
        second = dl.cancel();
        return serve(req, reply);
    });
    link.set_fallback(serve);

    REQUIRE(dl.start("/f").ok());
    dl.wait();

    CHECK(first.ok());
    CHECK(second == ErrorCode::NotInProgress);
    CHECK(log.cancelled_count() == 1);
    CHECK(log.completed_count() == 0);
    CHECK(log.failed_count() == 0);
    CHECK(link.sends() == 2);
    CHECK(dl.state() == TransferState::Cancelled);
    CHECK(dl.progress().offset == 0);
    CHECK(dl.cancel() == ErrorCode::NotInProgress);
    CHECK(log.cancelled_count() == 1);
}

TEST_CASE("pause immediately followed by resume changes nothing") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    auto serve = serve_file(file, 256);
    link.push([&](const Seen& req, RawReply& reply) {
        CHECK(dl.pause().ok());
        CHECK(dl.resume().ok());
        return serve(req, reply);
    });
    link.set_fallback(serve);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(log.completed_count() == 1);
    CHECK(log.data() == file);
}

TEST_CASE("A paused download parks after the in-flight chunk and resumes from there") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    auto serve = serve_file(file, 256);
    link.push([&](const Seen& req, RawReply& reply) {
        CHECK(dl.pause().ok());
        return serve(req, reply);
    });
    link.set_fallback(serve);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(dl.state() == TransferState::Paused);
    CHECK(dl.progress().offset == 256);
    CHECK(link.sends() == 1);
    CHECK(dl.pause() == ErrorCode::NotInProgress);

    REQUIRE(dl.resume().ok());
    dl.wait();
    CHECK(log.completed_count() == 1);
    CHECK(log.data() == file);
    CHECK(dl.resume() == ErrorCode::NotInProgress);
}

TEST_CASE("Cancelling a paused download reports once") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    auto serve = serve_file(file, 256);
    link.push([&](const Seen& req, RawReply& reply) {
        CHECK(dl.pause().ok());
        return serve(req, reply);
    });

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    REQUIRE(dl.state() == TransferState::Paused);
    REQUIRE(dl.cancel().ok());
    dl.wait();
    CHECK(log.cancelled_count() == 1);
    CHECK(dl.progress().offset == 0);
}

TEST_CASE("Progress never goes backwards within a session") {
    const Bytes file = pattern(3000);
    ScriptedTransport link(300);
    link.push(serve_file(file, 200));
    link.push_result(SendResult::Timeout);
    link.push(serve_file(file, 200));
    link.push_result(SendResult::Disconnected);
    link.set_fallback(serve_file(file, 200));
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    auto events = log.progress_events();
    REQUIRE(events.size() == 15);
    for (std::size_t i = 1; i < events.size(); ++i) CHECK(events[i].first >= events[i - 1].first);
    CHECK(events.back().first == 3000);
}

TEST_CASE("start is refused while a session runs, and allowed again afterwards") {
    const Bytes file = pattern(100);
    ScriptedTransport link(300);
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    Error nested;
    auto serve = serve_file(file, 64);
    link.push([&](const Seen& req, RawReply& reply) {
        nested = dl.start("/other");
        return serve(req, reply);
    });
    link.set_fallback(serve);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(nested == ErrorCode::AlreadyInProgress);
    CHECK(log.completed_count() == 1);

    REQUIRE(dl.start("/f").ok());
    dl.wait();
    CHECK(log.completed_count() == 2);
}

TEST_CASE("A link too small for a header is refused at start") {
    ScriptedTransport tiny(HEADER_LENGTH);
    Client client(tiny);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);
    CHECK(dl.start("/f") == ErrorCode::MtuTooSmall);
    CHECK(dl.state() == TransferState::Idle);

    ScriptedTransport coap(HEADER_LENGTH + TransferController::COAP_OVERHEAD, Scheme::CoapUdp);
    Client coap_client(coap);
    FileDownloader dl2(coap_client, obs);
    CHECK(dl2.start("/f") == ErrorCode::MtuTooSmall);
    CHECK(log.failed_count() == 0);
}

TEST_CASE("Control calls on an idle controller are refused") {
    ScriptedTransport link;
    Client client(link);
    EventLog log;
    RecordingDownload obs(log);
    FileDownloader dl(client, obs);

    CHECK(dl.pause() == ErrorCode::NotInProgress);
    CHECK(dl.resume() == ErrorCode::NotInProgress);
    CHECK(dl.cancel() == ErrorCode::NotInProgress);
    CHECK(dl.state() == TransferState::Idle);
    dl.wait();   // returns at once
    CHECK(std::string(to_string(dl.state())) == "idle");
}

namespace {

// Holds every on_progress until the test opens the gate.
class GatedDownload : public RecordingDownload {
public:
    GatedDownload(EventLog& log, std::shared_future<void> gate)
        : RecordingDownload(log), gate_(std::move(gate)) {}
    void on_progress(uint32_t current, uint32_t total, uint64_t ts) override {
        gate_.wait_for(std::chrono::seconds(5));
        RecordingDownload::on_progress(current, total, ts);
    }
private:
    std::shared_future<void> gate_;
};

// Deletes its own downloader from the terminal callback, like a view model
// that drops the controller once the transfer is over.
class OwningObserver : public DownloadObserver {
public:
    FileDownloader* owner{nullptr};

    void on_progress(uint32_t, uint32_t, uint64_t) override {}
    void on_cancelled() override { release(0); }
    void on_failed(const Error& e) override { release(e.code == ErrorCode::Ok ? 0 : -1); }
    void on_download_completed(const Bytes& data) override { release(static_cast<int>(data.size())); }

    bool wait_released(int& result) {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ok = cv_.wait_for(lock, std::chrono::seconds(5), [this] { return released_; });
        result = result_;
        return ok;
    }

private:
    void release(int result) {
        delete owner;
        owner = nullptr;
        std::lock_guard<std::mutex> lock(mutex_);
        result_   = result;
        released_ = true;
        cv_.notify_all();
    }

    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    released_{false};
    int                     result_{0};
};

} // namespace

TEST_CASE("A slow progress observer does not hold up the chunk requests") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    link.set_fallback(serve_file(file, 256));
    Client client(link);
    EventLog log;
    std::promise<void> gate;
    GatedDownload obs(log, gate.get_future().share());
    FileDownloader dl(client, obs);

    REQUIRE(dl.start("/f").ok());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (link.sends() < 4 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    CHECK(link.sends() == 4);                  // every chunk went out
    CHECK(log.progress_events().empty());      // while the first event was still held
    CHECK(log.completed_count() == 0);

    gate.set_value();
    dl.wait();
    CHECK(log.progress_events().size() == 4);
    CHECK(log.completed_count() == 1);
    CHECK(log.data() == file);
}

TEST_CASE("The downloader may be destroyed from its own terminal callback") {
    SUBCASE("after completion") {
        const Bytes file = pattern(700);
        ScriptedTransport link(300);
        link.set_fallback(serve_file(file, 256));
        Client client(link);
        OwningObserver obs;
        obs.owner = new FileDownloader(client, obs);

        REQUIRE(obs.owner->start("/f").ok());
        int result = 0;
        REQUIRE(obs.wait_released(result));
        CHECK(result == 700);
        CHECK(link.sends() == 3);
    }
    SUBCASE("after failure") {
        ScriptedTransport link(300);             // nothing answers
        Client client(link);
        OwningObserver obs;
        TransferConfig cfg;
        cfg.max_retries = 0;
        obs.owner = new FileDownloader(client, obs, cfg);

        REQUIRE(obs.owner->start("/f").ok());
        int result = 0;
        REQUIRE(obs.wait_released(result));
        CHECK(result == -1);
        CHECK(link.sends() == 1);
    }
}

TEST_CASE("Destroying a running downloader from a progress callback stops delivery") {
    const Bytes file = pattern(1000);
    ScriptedTransport link(300);
    link.set_fallback(serve_file(file, 256));
    Client client(link);

    struct DropOnFirstProgress : public DownloadObserver {
        FileDownloader* owner{nullptr};
        std::mutex mutex;
        std::condition_variable cv;
        int progress{0};
        int terminal{0};
        void on_progress(uint32_t, uint32_t, uint64_t) override {
            delete owner;
            owner = nullptr;
            std::lock_guard<std::mutex> lock(mutex);
            ++progress;
            cv.notify_all();
        }
        void on_cancelled() override { std::lock_guard<std::mutex> lock(mutex); ++terminal; }
        void on_failed(const Error&) override { std::lock_guard<std::mutex> lock(mutex); ++terminal; }
        void on_download_completed(const Bytes&) override { std::lock_guard<std::mutex> lock(mutex); ++terminal; }
    } obs;
    obs.owner = new FileDownloader(client, obs);

    REQUIRE(obs.owner->start("/f").ok());
    {
        std::unique_lock<std::mutex> lock(obs.mutex);
        REQUIRE(obs.cv.wait_for(lock, std::chrono::seconds(5), [&obs] { return obs.progress > 0; }));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard<std::mutex> lock(obs.mutex);
    CHECK(obs.progress == 1);
    CHECK(obs.terminal == 0);
}

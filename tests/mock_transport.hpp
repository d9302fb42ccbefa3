#pragma once
// Scripted in-memory transport and a small fake device for the unit tests.

#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "mcumgr/file_download.hpp"
#include "mcumgr/header.hpp"
#include "mcumgr/payload.hpp"
#include "mcumgr/transport/transport_base.hpp"
#include "mcumgr/upload.hpp"

namespace mcumgr::test {

using transport::RawReply;
using transport::SendResult;

/// A request as the fake device saw it.
struct Seen {
  Header   header;
  Document body;
};

/// Fill @p out with a standard reply to @p req carrying @p body.
inline void make_reply(const Header& req, const Document& body, RawReply& out) {
  Bytes cbor = payload::encode(body);
  const Op rop = (req.op == Op::Read) ? Op::ReadResponse : Op::WriteResponse;
  HeaderBytes h = encode_header(rop, 0, req.group, req.seq, req.id,
                                static_cast<uint16_t>(cbor.size()));
  out.bytes.assign(h.begin(), h.end());
  out.bytes.insert(out.bytes.end(), cbor.begin(), cbor.end());
}

/**
 * Each send() consumes the next scripted step; when the script is empty the
 * fallback handler (if any) answers. With neither, the link times out.
 */
class ScriptedTransport : public transport::ITransport {
public:
  using Handler = std::function<SendResult(const Seen& req, RawReply& reply)>;

  explicit ScriptedTransport(std::size_t mtu = 252, Scheme scheme = Scheme::StandardBle)
    : mtu_(mtu), scheme_(scheme) {}

  void push(Handler h) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::move(h));
  }

  void push_result(SendResult r) {
    push([r](const Seen&, RawReply&) { return r; });
  }

  void set_fallback(Handler h) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = std::move(h);
  }

  SendResult send(const std::vector<uint8_t>& request, RawReply& reply) override {
    Seen seen;
    if (!Header::decode(request.data(), request.size(), seen.header).ok()) return SendResult::Error;
    if (!payload::decode(request.data() + HEADER_LENGTH, request.size() - HEADER_LENGTH,
                         seen.body).ok())
      return SendResult::Error;

    Handler h;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_.push_back(seen);
      if (!script_.empty()) { h = std::move(script_.front()); script_.pop_front(); }
      else                  { h = fallback_; }
    }
    reply.clear();
    if (!h) return SendResult::Timeout;
    return h(seen, reply);
  }

  std::size_t mtu() const override { return mtu_; }
  Scheme scheme() const override { return scheme_; }
  const char* name() const override { return "scripted"; }

  bool request_high_throughput() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++throughput_requests_;
    return false;
  }

  std::vector<Seen> seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

  std::size_t sends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
  }

  int throughput_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throughput_requests_;
  }

private:
  mutable std::mutex  mutex_;
  std::deque<Handler> script_;
  Handler             fallback_;
  std::vector<Seen>   seen_;
  int                 throughput_requests_{0};
  std::size_t         mtu_;
  Scheme              scheme_;
};

/// Serves one file to download requests, @p chunk bytes per reply.
inline ScriptedTransport::Handler serve_file(const Bytes& file, std::size_t chunk) {
  return [file, chunk](const Seen& req, RawReply& reply) {
    int64_t off = 0;
    payload::get_int(req.body, "off", off);
    const std::size_t start = static_cast<std::size_t>(off);
    const std::size_t n = std::min(chunk, file.size() - start);
    Document body = Document::object();
    body["rc"] = 0;
    body["off"] = off;
    body["data"] = payload::bytes(file.data() + start, n);
    if (off == 0) body["len"] = file.size();
    make_reply(req.header, body, reply);
    return SendResult::Ok;
  };
}

/// Accepts upload chunks and appends them to @p sink; acknowledges the next offset.
inline ScriptedTransport::Handler accept_upload(Bytes& sink) {
  return [&sink](const Seen& req, RawReply& reply) {
    int64_t off = 0;
    payload::get_int(req.body, "off", off);
    Bytes data;
    payload::get_bytes(req.body, "data", data);
    if (off == 0) sink.clear();
    sink.insert(sink.end(), data.begin(), data.end());
    Document body = Document::object();
    body["rc"] = 0;
    body["off"] = off + static_cast<int64_t>(data.size());
    make_reply(req.header, body, reply);
    return SendResult::Ok;
  };
}

/// Records every observer event; thread safe.
class EventLog {
public:
  void progress(uint32_t current, uint32_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.push_back({current, total});
  }
  void cancelled() { std::lock_guard<std::mutex> lock(mutex_); ++cancelled_; }
  void failed(const Error& e) { std::lock_guard<std::mutex> lock(mutex_); ++failed_; error_ = e; }
  void completed(const Bytes& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++completed_;
    data_ = data;
  }

  std::vector<std::pair<uint32_t, uint32_t>> progress_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
  }
  int cancelled_count() const { std::lock_guard<std::mutex> lock(mutex_); return cancelled_; }
  int failed_count() const    { std::lock_guard<std::mutex> lock(mutex_); return failed_; }
  int completed_count() const { std::lock_guard<std::mutex> lock(mutex_); return completed_; }
  Error error() const         { std::lock_guard<std::mutex> lock(mutex_); return error_; }
  Bytes data() const          { std::lock_guard<std::mutex> lock(mutex_); return data_; }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<uint32_t, uint32_t>> progress_;
  int cancelled_{0};
  int failed_{0};
  int completed_{0};
  Error error_;
  Bytes data_;
};

class RecordingDownload : public DownloadObserver {
public:
  explicit RecordingDownload(EventLog& log) : log_(log) {}
  void on_progress(uint32_t current, uint32_t total, uint64_t) override { log_.progress(current, total); }
  void on_cancelled() override { log_.cancelled(); }
  void on_failed(const Error& e) override { log_.failed(e); }
  void on_download_completed(const Bytes& data) override { log_.completed(data); }
private:
  EventLog& log_;
};

class RecordingUpload : public UploadObserver {
public:
  explicit RecordingUpload(EventLog& log) : log_(log) {}
  void on_progress(uint32_t current, uint32_t total, uint64_t) override { log_.progress(current, total); }
  void on_cancelled() override { log_.cancelled(); }
  void on_failed(const Error& e) override { log_.failed(e); }
  void on_upload_completed() override { log_.completed(Bytes()); }
private:
  EventLog& log_;
};

/// Deterministic test content.
inline Bytes pattern(std::size_t n) {
  Bytes b(n);
  for (std::size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>((i * 7 + 3) & 0xFF);
  return b;
}

} // namespace mcumgr::test

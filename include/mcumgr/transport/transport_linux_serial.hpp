#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport carrying console-framed SMP (header-only; termios).
 *
 * Depends on: serial_io.hpp (open/read/write/close), console_framing.hpp.
 * Scheme is always Standard: replies come back as header + CBOR body.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "mcumgr/header.hpp"
#include "mcumgr/transport/transport_base.hpp"
#include "serial_io.hpp"
#include <chrono>
#include <string>

namespace mcumgr::transport {

struct SerialConfig : public Config {
  std::string path;            // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int boot_delay_ms{400};      // USB CDC devices may reset on open
};

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  explicit LinuxSerial(const SerialConfig& cfg) : cfg_(cfg) {}
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  /// Open the port described by @p cfg (or the constructor's config).
  bool begin(const SerialConfig& cfg) {
    cfg_ = cfg;
    return begin();
  }

  bool begin() {
    end();
    if (cfg_.path.empty()) return false;
    fd_ = open_serial(cfg_.path, cfg_.baud, cfg_.boot_delay_ms);
    return fd_ >= 0;
  }

  void end() {
    close_serial(fd_);
    fd_ = -1;
  }

  bool is_open() const { return fd_ >= 0; }

  /**
   * @brief Write one request and read back the reply that carries its sequence number.
   *
   * A device that answered an earlier request after its timeout leaves that
   * frame behind on the line. Input is flushed before writing, and frames whose
   * sequence number differs from the request's are skipped until the deadline.
   */
  SendResult send(const std::vector<uint8_t>& request, RawReply& reply) override {
    reply.clear();
    if (fd_ < 0) return SendResult::Disconnected;

    flush_input(fd_);                                   // late frames from timed-out requests
    if (!write_frame(fd_, request)) return SendResult::Error;

    const bool match_seq = request.size() >= HEADER_LENGTH;
    const uint8_t seq    = match_seq ? request[SEQ_OFFSET] : 0;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(cfg_.timeout_ms);

    for (;;) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - clock::now()).count();
      if (left <= 0) return SendResult::Timeout;

      switch (read_frame(fd_, reply.bytes, static_cast<int>(left))) {
        case IoStatus::Ok:
          // short frames go up as-is; the response builder rejects them
          if (!match_seq || reply.bytes.size() < HEADER_LENGTH) return SendResult::Ok;
          if (reply.bytes[SEQ_OFFSET] == seq)                   return SendResult::Ok;
          reply.bytes.clear();                          // answer to an older request
          continue;
        case IoStatus::Timeout: return SendResult::Timeout;
        case IoStatus::Closed:  end(); return SendResult::Disconnected;
        case IoStatus::Error:   return SendResult::Error;
      }
      return SendResult::Error;
    }
  }

  const char* name()   const override { return "linux-serial"; }
  std::size_t mtu()    const override { return cfg_.mtu; }
  Scheme      scheme() const override { return Scheme::Standard; }

  const SerialConfig& config() const { return cfg_; }

private:
  static constexpr std::size_t SEQ_OFFSET = 6;         // header byte holding seq

  SerialConfig cfg_;
  int fd_{-1};
};

} // namespace mcumgr::transport

/**
 * @file main.cpp
 * @brief mcumgr-cli: one-shot device management over a serial console link.
 *
 * Responsibilities:
 *  - Load defaults from $XDG_CONFIG_HOME/mcumgr/mcumgr-cli.json; command-line
 *    options override them; --save-config writes the effective set back.
 *  - Open the serial transport, run exactly one subcommand, print the result
 *    as `key=value` status lines (or JSON with --format json).
 *  - Transfers print `progress=<off>/<total>` lines when --progress is given.
 *
 * Exit codes: 0 ok, 1 device or I/O failure, 2 usage error, 3 timeout.
 */

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "commands.hpp"
#include "mcumgr/client.hpp"
#include "mcumgr/file_download.hpp"
#include "mcumgr/file_upload.hpp"
#include "mcumgr/image_upload.hpp"
#include "mcumgr/transport/transport_linux_serial.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace mcumgr;

enum : int { EXIT_OK = 0, EXIT_IO = 1, EXIT_USAGE = 2, EXIT_TIMEOUT = 3 };

// ---------- settings ----------

struct CliSettings {
  std::string dev{"/dev/ttyACM0"};
  int baud{115200};
  int mtu{256};
  int timeout_ms{3000};
  int retries{TransferController::RETRIES_DEFAULT};
  int boot_delay_ms{400};
};

static fs::path default_config_file() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "mcumgr" / "mcumgr-cli.json";
}

// Missing file is fine; a file that does not parse is reported and ignored.
static void load_settings(const fs::path& p, CliSettings& s) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return;
  std::ifstream in(p);
  if (!in) return;

  json j = json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cerr << "status=warn reason=config_unreadable path=" << p.string() << "\n";
    return;
  }
  if (j.contains("dev") && j["dev"].is_string())                  s.dev = j["dev"].get<std::string>();
  if (j.contains("baud") && j["baud"].is_number_integer())        s.baud = j["baud"].get<int>();
  if (j.contains("mtu") && j["mtu"].is_number_integer())          s.mtu = j["mtu"].get<int>();
  if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) s.timeout_ms = j["timeout_ms"].get<int>();
  if (j.contains("retries") && j["retries"].is_number_integer())  s.retries = j["retries"].get<int>();
}

static bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  if (ec) return false;

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

static bool save_settings(const fs::path& p, const CliSettings& s) {
  json j;
  j["dev"] = s.dev;
  j["baud"] = s.baud;
  j["mtu"] = s.mtu;
  j["timeout_ms"] = s.timeout_ms;
  j["retries"] = s.retries;
  return atomic_write_json(p, j);
}

// ---------- files ----------

static bool read_file(const std::string& path, Bytes& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static bool write_file(const std::string& path, const Bytes& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(out);
}

// ---------- reporting ----------

struct Reporter {
  bool json_out{false};
  bool progress{false};

  void ok(const char* cmd, const json& fields) const {
    if (json_out) {
      json j = fields;
      j["status"] = "ok";
      j["cmd"] = cmd;
      std::cout << j.dump() << "\n";
      return;
    }
    std::cout << "status=ok cmd=" << cmd;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      std::cout << ' ' << it.key() << '=';
      if (it.value().is_string()) std::cout << it.value().get<std::string>();
      else                        std::cout << it.value().dump();
    }
    std::cout << "\n";
  }

  // Also returns the exit code for @p e.
  int fail(const char* cmd, const Error& e) const {
    if (json_out) {
      json j;
      j["status"] = "error";
      j["cmd"] = cmd;
      j["reason"] = to_string(e.code);
      if (e.code == ErrorCode::NonZeroReturnCode) {
        j["rc"] = return_code_name(e.value);
        if (e.group) j["group"] = e.group;
      } else if (e.code == ErrorCode::CoapError) {
        j["coap"] = e.value;
      }
      std::cerr << j.dump() << "\n";
    } else {
      std::cerr << "status=error cmd=" << cmd << " reason=" << to_string(e.code);
      if (e.code == ErrorCode::NonZeroReturnCode) {
        std::cerr << " rc=" << return_code_name(e.value);
        if (e.group) std::cerr << " group=" << e.group;
      } else if (e.code == ErrorCode::CoapError) {
        std::cerr << " coap=" << e.value;
      }
      std::cerr << "\n";
    }
    return e.code == ErrorCode::TransportTimeout ? EXIT_TIMEOUT : EXIT_IO;
  }

  void usage(const std::string& reason) const {
    std::cerr << "status=error reason=" << reason << "\n";
  }

  void on_progress(uint32_t current, uint32_t total) const {
    if (!progress) return;
    if (json_out) std::cerr << json{{"progress", current}, {"total", total}}.dump() << "\n";
    else          std::cerr << "progress=" << current << "/" << total << "\n";
  }
};

// ---------- observers ----------
// Callbacks run on the transfer notifier; main() reads the outcome after wait().

struct Outcome {
  bool done{false};
  Error error;
  Bytes data;
};

class CliDownloadObserver : public DownloadObserver {
public:
  CliDownloadObserver(const Reporter& r, Outcome& o) : rep_(r), out_(o) {}
  void on_progress(uint32_t current, uint32_t total, uint64_t) override { rep_.on_progress(current, total); }
  void on_cancelled() override { out_.error = Error(ErrorCode::NotInProgress); }
  void on_failed(const Error& e) override { out_.error = e; }
  void on_download_completed(const Bytes& data) override { out_.done = true; out_.data = data; }
private:
  const Reporter& rep_;
  Outcome& out_;
};

class CliUploadObserver : public UploadObserver {
public:
  CliUploadObserver(const Reporter& r, Outcome& o) : rep_(r), out_(o) {}
  void on_progress(uint32_t current, uint32_t total, uint64_t) override { rep_.on_progress(current, total); }
  void on_cancelled() override { out_.error = Error(ErrorCode::NotInProgress); }
  void on_failed(const Error& e) override { out_.error = e; }
  void on_upload_completed() override { out_.done = true; }
private:
  const Reporter& rep_;
  Outcome& out_;
};

// ---------- main ----------

int main(int argc, char** argv) {
  const fs::path config_file = default_config_file();
  CliSettings cfg;
  load_settings(config_file, cfg);

  Reporter rep;
  std::string format = "pretty";
  bool save_config = false;

  CLI::App app{"mcumgr device management CLI"};
  app.add_option("--dev", cfg.dev, "Serial device (e.g. /dev/serial/by-id/...)")->capture_default_str();
  app.add_option("--baud", cfg.baud, "Baud rate")->capture_default_str();
  app.add_option("--mtu", cfg.mtu, "Largest SMP packet per exchange")->capture_default_str()
     ->check(CLI::Range(16, 0xFFFF));
  app.add_option("--timeout", cfg.timeout_ms, "Reply timeout (ms)")->capture_default_str();
  app.add_option("--retries", cfg.retries, "Retries per transfer chunk")->capture_default_str()
     ->check(CLI::Range(0, 255));
  app.add_option("--boot-delay", cfg.boot_delay_ms, "Delay after open (ms) to let USB reset");
  app.add_option("--format", format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--progress", rep.progress, "Print transfer progress lines");
  app.add_flag("--save-config", save_config, "Write the effective settings to the config file");
  app.require_subcommand(0, 1);

  std::string echo_text;
  CLI::App* cmd_echo = app.add_subcommand("echo", "Echo text through the device");
  cmd_echo->add_option("text", echo_text, "Text to echo")->required();

  std::string dl_remote, dl_local;
  CLI::App* cmd_dl = app.add_subcommand("download", "Download a file from the device");
  cmd_dl->add_option("remote", dl_remote, "Path on the device")->required();
  cmd_dl->add_option("local", dl_local, "Local destination")->required();

  std::string up_local, up_remote;
  CLI::App* cmd_up = app.add_subcommand("upload", "Upload a file to the device");
  cmd_up->add_option("local", up_local, "Local source")->required();
  cmd_up->add_option("remote", up_remote, "Path on the device")->required();

  std::string img_file;
  int img_slot = 0;
  CLI::App* cmd_img = app.add_subcommand("image-upload", "Upload a firmware image");
  cmd_img->add_option("file", img_file, "Signed image file")->required();
  cmd_img->add_option("--image", img_slot, "Image number")->check(CLI::Range(0, 255));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? EXIT_OK : EXIT_USAGE;
  }
  rep.json_out = (format == "json");

  if (save_config) {
    if (!save_settings(config_file, cfg)) {
      rep.usage("config_write_failed path=" + config_file.string());
      return EXIT_IO;
    }
    if (app.get_subcommands().empty()) {
      rep.ok("save-config", json{{"path", config_file.string()}});
      return EXIT_OK;
    }
  }
  if (app.get_subcommands().empty()) {
    rep.usage("need_subcommand");
    return EXIT_USAGE;
  }

  // -------- link --------
  transport::SerialConfig sc;
  sc.path = cfg.dev;
  sc.baud = cfg.baud;
  sc.mtu = static_cast<uint16_t>(cfg.mtu);
  sc.timeout_ms = cfg.timeout_ms;
  sc.boot_delay_ms = cfg.boot_delay_ms;

  transport::LinuxSerial serial;
  if (!serial.begin(sc)) {
    std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
    return EXIT_IO;
  }
  Client client(serial);

  TransferConfig tc;
  tc.max_retries = static_cast<uint8_t>(cfg.retries);

  // -------- echo --------
  if (*cmd_echo) {
    std::string reply;
    Error e = echo(client, echo_text, reply);
    if (!e.ok()) return rep.fail("echo", e);
    rep.ok("echo", json{{"r", reply}});
    return EXIT_OK;
  }

  // -------- download --------
  if (*cmd_dl) {
    Outcome out;
    CliDownloadObserver obs(rep, out);
    FileDownloader dl(client, obs, tc);
    Error e = dl.start(dl_remote);
    if (!e.ok()) return rep.fail("download", e);
    dl.wait();
    if (!out.done) return rep.fail("download", out.error);
    if (!write_file(dl_local, out.data)) {
      rep.usage("write_failed path=" + dl_local);
      return EXIT_IO;
    }
    rep.ok("download", json{{"remote", dl_remote}, {"local", dl_local}, {"bytes", out.data.size()}});
    return EXIT_OK;
  }

  // -------- upload / image-upload --------
  const bool is_image = static_cast<bool>(*cmd_img);
  const std::string& src = is_image ? img_file : up_local;
  const char* name = is_image ? "image-upload" : "upload";

  Bytes data;
  if (!read_file(src, data)) {
    rep.usage("read_failed path=" + src);
    return EXIT_USAGE;
  }
  const std::size_t size = data.size();

  Outcome out;
  CliUploadObserver obs(rep, out);
  Error e;
  if (is_image) {
    ImageUploader up(client, obs, tc);
    e = up.start(static_cast<uint8_t>(img_slot), std::move(data));
    if (e.ok()) up.wait();
  } else {
    FileUploader up(client, obs, tc);
    e = up.start(up_remote, std::move(data));
    if (e.ok()) up.wait();
  }
  if (!e.ok())    return rep.fail(name, e);
  if (!out.done) return rep.fail(name, out.error);

  json fields{{"bytes", size}};
  if (is_image) fields["image"] = img_slot;
  else          fields["remote"] = up_remote;
  rep.ok(name, fields);
  return EXIT_OK;
}

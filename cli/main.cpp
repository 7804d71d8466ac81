/**
 * @file main.cpp
 * @brief fusionflex-cli: interactive line console for one Fusion Flex amplifier.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and resolve the connection: --serial / --udp on
 *    the command line win over --config, which wins over the default config file
 *    ($XDG_CONFIG_HOME/fusionflex/device.json, else ~/.config/fusionflex/device.json).
 *  - Start the device and run a poll(2) loop over stdin and the transport fd.
 *  - Print every status change as one JSON line on stdout.
 *  - Turn typed lines into device commands; rejections print
 *    "status=error reason=<token>" on stderr.
 *
 * Exit codes: 0 normal, 1 transport failure / connection lost, 2 usage or config error.
 */

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "fusionflex/command.hpp"
#include "fusionflex/connection.hpp"
#include "fusionflex/device.hpp"
#include "fusionflex/log.hpp"
#include "fusionflex/status.hpp"

using namespace fusionflex;

// ---------- small utilities ----------

static std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return std::string(xdg) + "/fusionflex/device.json";
  const char* home = std::getenv("HOME");
  return std::string(home ? home : "") + "/.config/fusionflex/device.json";
}

static bool file_exists(const std::string& p) { return ::access(p.c_str(), R_OK) == 0; }

static void print_help() {
  std::cout <<
    "commands:\n"
    "  on | off                 power\n"
    "  mute | unmute | toggle   mute\n"
    "  up | down                volume step (0.5 dB)\n"
    "  vol <dB>                 set volume, -95.5..0\n"
    "  level <0..1>             set volume as a fraction\n"
    "  auto | input1 | input2   select input\n"
    "  status                   print last known status\n"
    "  help | quit\n";
}

static void print_status(const StatusSnapshot& st) {
  if (!st) { std::cout << "null\n"; return; }
  nlohmann::json j = *st;
  std::cout << j.dump() << "\n" << std::flush;
}

// Prints each published snapshot; remembers a loss so main() can exit 1.
struct ConsoleObserver : DeviceObserver {
  bool lost{false};

  void on_status_changed(const FusionFlexDevice&, const StatusSnapshot& status) override {
    print_status(status);
  }
  void on_connection_lost(const FusionFlexDevice&, const std::string& reason) override {
    std::cerr << "status=error reason=connection_lost detail=\"" << reason << "\"\n";
    lost = true;
  }
};

static bool parse_float(const std::string& s, float& out) {
  char* e = nullptr;
  out = std::strtof(s.c_str(), &e);
  return e && e != s.c_str() && *e == '\0';
}

// One typed line -> one command. Returns false when the user asked to quit.
static bool handle_line(FusionFlexDevice& dev, const std::string& line) {
  std::istringstream is(line);
  std::string verb, arg;
  is >> verb >> arg;
  if (verb.empty()) return true;

  if (verb == "quit" || verb == "exit") return false;
  if (verb == "help" || verb == "h")    { print_help(); return true; }
  if (verb == "status")                 { print_status(dev.status()); return true; }

  Result r = Result::Ok;
  Command cmd = Command::PowerOn;
  float value = 0.0f;

  if (verb == "vol") {
    if (!parse_float(arg, value)) { std::cerr << "status=error reason=bad_value:vol\n"; return true; }
    r = dev.set_volume_level_decibels(value);
  } else if (verb == "level") {
    if (!parse_float(arg, value)) { std::cerr << "status=error reason=bad_value:level\n"; return true; }
    r = dev.set_volume_level_fraction(value);
  } else if (name_to_command(verb, cmd)) {
    r = dev.send_command(cmd);
  } else {
    std::cerr << "status=error reason=unknown_command:" << verb << "\n";
    return true;
  }

  if (r != Result::Ok) std::cerr << "status=error reason=" << to_string(r) << "\n";
  return true;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"Emotiva Fusion Flex console"};

  std::string serial_port, udp_remote, config_path, log_level = "warn";
  std::string local_ip = "0.0.0.0";
  int baud = SERIAL_DEFAULT_BAUD;
  uint16_t local_port = 0;

  auto* opt_serial = app.add_option("--serial", serial_port, "Serial device (e.g. /dev/ttyUSB0)");
  auto* opt_udp    = app.add_option("--udp", udp_remote, "Remote UDP endpoint host:port");
  opt_serial->excludes(opt_udp);
  app.add_option("--baud", baud, "Serial baud rate")->capture_default_str();
  app.add_option("--local-ip", local_ip, "Local address to bind for UDP")->capture_default_str();
  app.add_option("--local-port", local_port, "Local UDP port (0 = any)")->capture_default_str();
  app.add_option("--config", config_path, "Connection JSON file");
  app.add_option("--log-level", log_level, "trace|debug|info|warn|error|off")->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);            // prints help or the parse error
    return rc == 0 ? 0 : 2;
  }

  log::Level lvl = log::Level::Warn;
  if (!log::level_from_string(log_level, lvl)) {
    std::cerr << "status=error reason=bad_value:log-level\n";
    return 2;
  }
  log::set_level(lvl);

  // ===== Connection resolution =====
  Connection conn;
  std::string err;
  if (!serial_port.empty()) {
    conn = SerialEndpoint{serial_port, baud};
  } else if (!udp_remote.empty()) {
    UdpEndpoint u;
    u.local_ip   = local_ip;
    u.local_port = local_port;
    if (!parse_host_port(udp_remote, u.remote_host, u.remote_port)) {
      std::cerr << "status=error reason=bad_value:udp\n";
      return 2;
    }
    conn = u;
  } else {
    const std::string path = config_path.empty() ? default_config_path() : config_path;
    if (config_path.empty() && !file_exists(path)) {
      std::cerr << "status=error reason=need_connection (use --serial, --udp or --config)\n";
      return 2;
    }
    if (!load_connection(path, conn, err)) {
      std::cerr << "status=error reason=" << err << " config=" << path << "\n";
      return 2;
    }
  }

  FusionFlexDevice dev(conn);
  ConsoleObserver console;
  dev.subscribe(console);

  if (dev.start() != Result::Ok) {
    std::cerr << "status=error reason=open_failed target=" << describe(conn) << "\n";
    return 1;
  }
  std::cerr << "status=ok target=" << describe(conn) << " (type 'help')\n";

  // -------- event loop: stdin + transport --------
  std::string pending;
  bool running = true;
  while (running && !console.lost) {
    pollfd fds[2];
    fds[0] = pollfd{STDIN_FILENO, POLLIN, 0};
    fds[1] = pollfd{dev.fd(), POLLIN, 0};

    const int pr = ::poll(fds, 2, 250);
    if (pr < 0) {
      if (errno == EINTR) continue;
      std::cerr << "status=error reason=poll_failed detail=\"" << std::strerror(errno) << "\"\n";
      break;
    }

    if (fds[1].revents & (POLLIN | POLLERR | POLLHUP)) dev.poll();

    if (fds[0].revents & (POLLIN | POLLHUP)) {
      char buf[256];
      const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n <= 0) break;                                   // EOF on stdin
      pending.append(buf, static_cast<size_t>(n));

      size_t nl;
      while (running && (nl = pending.find('\n')) != std::string::npos) {
        running = handle_line(dev, pending.substr(0, nl));
        pending.erase(0, nl + 1);
      }
    }
  }

  dev.stop();
  return console.lost ? 1 : 0;
}

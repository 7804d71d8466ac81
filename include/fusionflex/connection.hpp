#pragma once
/**
 * @file connection.hpp
 * @brief Where the amplifier lives: a serial port or a UDP endpoint.
 *
 * @details
 * The two connection kinds share no fields, so they are separate structs held
 * in a std::variant. A UDP connection cannot carry a baud rate and a serial
 * connection cannot carry a remote host; the type system says so.
 *
 * Descriptors can be written by hand or loaded from a small JSON file:
 * @code
 *   { "type": "serial", "port": "/dev/ttyUSB0", "baud": 9600 }
 *   { "type": "udp", "local_ip": "0.0.0.0", "local_port": 0,
 *     "remote_host": "192.168.1.50", "remote_port": 5000 }
 * @endcode
 * Parsing never throws. Failures come back as false plus a stable reason
 * string ("missing:port", "bad_type", "parse_error", ...) in @p err.
 */

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace fusionflex {

static constexpr int SERIAL_DEFAULT_BAUD = 9600;  ///< Fusion Flex RS-232 port, 8N1

enum class ConnectionType : uint8_t { Serial = 0, Udp = 1 };

struct SerialEndpoint {
  std::string port;                  ///< e.g. /dev/ttyUSB0 or /dev/serial/by-id/...
  int         baud{SERIAL_DEFAULT_BAUD};
};

struct UdpEndpoint {
  std::string local_ip{"0.0.0.0"};   ///< address to bind; any interface by default
  uint16_t    local_port{0};         ///< 0 lets the kernel pick
  std::string remote_host;           ///< hostname or dotted quad of the bridge
  uint16_t    remote_port{0};
};

using Connection = std::variant<SerialEndpoint, UdpEndpoint>;

ConnectionType connection_type(const Connection& c);
const char*    to_string(ConnectionType t);

/// "serial:/dev/ttyUSB0@9600" or "udp:0.0.0.0:0->192.168.1.50:5000"; for logs.
std::string describe(const Connection& c);

/// Split "host:port" into a UdpEndpoint's remote fields. False on bad syntax/port.
bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

bool connection_from_json(const nlohmann::json& j, Connection& out, std::string& err);
nlohmann::json connection_to_json(const Connection& c);

/// Read and parse a JSON descriptor file.
bool load_connection(const std::string& path, Connection& out, std::string& err);

} // namespace fusionflex

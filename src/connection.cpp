// ============================================================================
// connection.cpp: implementation for connection.hpp
// JSON handling is nlohmann::json; every failure path returns a reason token
// instead of throwing.
// ============================================================================

#include "fusionflex/connection.hpp"

#include <cstdlib>    // strtoul for the port number
#include <fstream>    // std::ifstream for load_connection()
#include <sstream>

using nlohmann::json;

namespace fusionflex {

namespace {

// Fetch an optional string member. Missing is fine; wrong type is not.
bool get_string(const json& j, const char* key, std::string& out, bool required, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) {
    if (required) { err = std::string("missing:") + key; return false; }
    return true;
  }
  if (!it->is_string()) { err = std::string("bad_value:") + key; return false; }
  out = it->get<std::string>();
  return true;
}

bool get_port(const json& j, const char* key, uint16_t& out, bool required, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) {
    if (required) { err = std::string("missing:") + key; return false; }
    return true;
  }
  // signed or unsigned storage depends on how the value was built
  if (!it->is_number_integer() || it->get<int64_t>() < 0 || it->get<int64_t>() > 65535) {
    err = std::string("bad_value:") + key;
    return false;
  }
  out = static_cast<uint16_t>(it->get<int64_t>());
  return true;
}

} // namespace

ConnectionType connection_type(const Connection& c) {
  return std::holds_alternative<SerialEndpoint>(c) ? ConnectionType::Serial : ConnectionType::Udp;
}

const char* to_string(ConnectionType t) {
  switch (t) {
    case ConnectionType::Serial: return "serial";
    case ConnectionType::Udp:    return "udp";
  }
  return "unknown";
}

std::string describe(const Connection& c) {
  std::ostringstream os;
  if (const auto* s = std::get_if<SerialEndpoint>(&c)) {
    os << "serial:" << s->port << "@" << s->baud;
  } else {
    const auto& u = std::get<UdpEndpoint>(c);
    os << "udp:" << u.local_ip << ":" << u.local_port
       << "->" << u.remote_host << ":" << u.remote_port;
  }
  return os.str();
}

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port) {
  const size_t colon = s.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size()) return false;

  char* e = nullptr;
  const unsigned long v = std::strtoul(s.c_str() + colon + 1, &e, 10);
  if (!e || *e || v == 0 || v > 65535ul) return false;

  host = s.substr(0, colon);
  port = static_cast<uint16_t>(v);
  return true;
}

bool connection_from_json(const json& j, Connection& out, std::string& err) {
  if (!j.is_object()) { err = "not_object"; return false; }

  std::string type;
  if (!get_string(j, "type", type, /*required*/true, err)) return false;

  if (type == "serial") {
    SerialEndpoint s;
    if (!get_string(j, "port", s.port, true, err)) return false;
    if (s.port.empty()) { err = "bad_value:port"; return false; }
    auto it = j.find("baud");
    if (it != j.end()) {
      if (!it->is_number_integer() || it->get<int64_t>() <= 0) { err = "bad_value:baud"; return false; }
      s.baud = static_cast<int>(it->get<int64_t>());
    }
    out = s;
    return true;
  }

  if (type == "udp") {
    UdpEndpoint u;
    if (!get_string(j, "local_ip", u.local_ip, false, err)) return false;
    if (!get_port(j, "local_port", u.local_port, false, err)) return false;
    if (!get_string(j, "remote_host", u.remote_host, true, err)) return false;
    if (!get_port(j, "remote_port", u.remote_port, true, err)) return false;
    if (u.remote_host.empty()) { err = "bad_value:remote_host"; return false; }
    if (u.remote_port == 0)    { err = "bad_value:remote_port"; return false; }
    out = u;
    return true;
  }

  err = "bad_type";
  return false;
}

json connection_to_json(const Connection& c) {
  json j;
  if (const auto* s = std::get_if<SerialEndpoint>(&c)) {
    j["type"] = "serial";
    j["port"] = s->port;
    j["baud"] = s->baud;
  } else {
    const auto& u = std::get<UdpEndpoint>(c);
    j["type"]        = "udp";
    j["local_ip"]    = u.local_ip;
    j["local_port"]  = u.local_port;
    j["remote_host"] = u.remote_host;
    j["remote_port"] = u.remote_port;
  }
  return j;
}

bool load_connection(const std::string& path, Connection& out, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }

  // allow_exceptions=false: a syntax error yields a discarded value, no throw
  const json j = json::parse(in, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded()) { err = "parse_error"; return false; }
  return connection_from_json(j, out, err);
}

} // namespace fusionflex

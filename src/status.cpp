// -----------------------------------------------------------------------------
// status.cpp: device status state machine
//
// API contract and rule table: include/fusionflex/status.hpp
// Scenarios: tests/test_status.cpp
// -----------------------------------------------------------------------------
#include "fusionflex/status.hpp"
#include "fusionflex/log.hpp"
#include "fusionflex/volume.hpp"

#include <cctype>

namespace fusionflex {

std::optional<float> DeviceStatus::volume_fraction() const {
  if (!volume_db) return std::nullopt;
  return db_to_fraction(*volume_db);
}

// "'@11" + [STP] + "-" + D + D + "." + [05] + "'"  -> exactly 11 characters
std::optional<float> parse_volume_report(const std::string& msg) {
  static constexpr size_t REPORT_LEN = 11;
  if (msg.size() != REPORT_LEN) return std::nullopt;
  if (msg.compare(0, 4, "'@11") != 0) return std::nullopt;

  const char kind = msg[4];
  if (kind != 'S' && kind != 'T' && kind != 'P') return std::nullopt;

  if (msg[5] != '-') return std::nullopt;
  if (!std::isdigit((unsigned char)msg[6]) || !std::isdigit((unsigned char)msg[7])) return std::nullopt;
  if (msg[8] != '.') return std::nullopt;
  if (msg[9] != '0' && msg[9] != '5') return std::nullopt;
  if (msg[10] != '\'') return std::nullopt;

  // No range check: two digits under a fixed '-' cannot go below -99.5 dB.
  const int   whole = (msg[6] - '0') * 10 + (msg[7] - '0');
  const float tenth = (msg[9] == '5') ? 0.5f : 0.0f;
  return -(static_cast<float>(whole) + tenth);
}

std::optional<DeviceStatus> apply_message(const DeviceStatus* current, const std::string& msg) {
  DeviceStatus next = current ? *current : DeviceStatus{};  // default: on, rest unknown

  if (auto vol = parse_volume_report(msg)) {
    next.volume_db = *vol;
  } else if (msg == wire_string(Command::PowerOn)) {
    next.is_turned_on = true;
  } else if (msg == wire_string(Command::PowerOff)) {
    next.is_turned_on = false;
  } else if (msg == wire_string(Command::SelectInput1)) {
    next.source_mode = SourceMode::Input1;
  } else if (msg == wire_string(Command::SelectInput2)) {
    next.source_mode = SourceMode::Input2;
  } else if (msg == wire_string(Command::SelectInputAuto)) {
    next.source_mode = SourceMode::Auto;
  } else if (msg == wire_string(Command::MuteOn)) {
    next.is_muted = true;
  } else if (msg == wire_string(Command::MuteOff)) {
    next.is_muted = false;
  } else {
    log::warn("ignoring unknown message: \"{}\"", msg);
    return std::nullopt;
  }

  // Anything but an explicit power-off means the amplifier is awake.
  if (msg != wire_string(Command::PowerOff)) next.is_turned_on = true;
  return next;
}

void to_json(nlohmann::json& j, const DeviceStatus& s) {
  j = nlohmann::json::object();
  j["is_turned_on"] = s.is_turned_on;
  j["volume_db"]    = s.volume_db ? nlohmann::json(*s.volume_db) : nlohmann::json(nullptr);
  j["source_mode"]  = s.source_mode ? nlohmann::json(to_string(*s.source_mode)) : nlohmann::json(nullptr);
  j["is_muted"]     = s.is_muted ? nlohmann::json(*s.is_muted) : nlohmann::json(nullptr);
}

} // namespace fusionflex

// -----------------------------------------------------------------------------
// Implementation for command.hpp
//
// - The wire table lives in wire_string(); status.cpp matches inbound frames
//   against the very same strings.
// - No exceptions; failures are Result values.
// -----------------------------------------------------------------------------

#include "fusionflex/command.hpp"
#include "fusionflex/volume.hpp"

#include <cctype>    // std::tolower for name lookup
#include <cmath>     // std::nearbyint, std::fabs, std::isfinite
#include <iomanip>   // std::setw / std::setfill / std::setprecision
#include <sstream>   // std::ostringstream for the set-volume frame

namespace fusionflex {

static std::string lower(std::string s) {
  for (auto& c : s)
    c = (char)std::tolower((unsigned char)c);
  return s;
}

const char* wire_string(Command cmd) {
  switch (cmd) {
    case Command::PowerOn:         return "'@112'";
    case Command::PowerOff:        return "'@113'";
    case Command::SelectInput1:    return "'@15A'";
    case Command::SelectInput2:    return "'@15B'";
    case Command::SelectInputAuto: return "'@15Z'";
    case Command::MuteOn:          return "'@11Q'";
    case Command::MuteOff:         return "'@11R'";
    case Command::MuteToggle:      return "'@11U'";
    case Command::VolumeUp:        return "'@11S'";
    case Command::VolumeDown:      return "'@11T'";
  }
  return "";
}

const char* to_string(Command cmd) {
  switch (cmd) {
    case Command::PowerOn:         return "power_on";
    case Command::PowerOff:        return "power_off";
    case Command::SelectInput1:    return "select_input_1";
    case Command::SelectInput2:    return "select_input_2";
    case Command::SelectInputAuto: return "select_input_auto";
    case Command::MuteOn:          return "mute_on";
    case Command::MuteOff:         return "mute_off";
    case Command::MuteToggle:      return "mute_toggle";
    case Command::VolumeUp:        return "volume_up";
    case Command::VolumeDown:      return "volume_down";
  }
  return "unknown";
}

const char* to_string(SourceMode mode) {
  switch (mode) {
    case SourceMode::Auto:   return "AUTO";
    case SourceMode::Input1: return "INPUT_1";
    case SourceMode::Input2: return "INPUT_2";
  }
  return nullptr;
}

bool source_from_string(const std::string& raw, SourceMode& out) {
  const std::string name = lower(raw);
  if (name == "auto" || name == "0")                                  { out = SourceMode::Auto;   return true; }
  if (name == "input_1" || name == "input1" || name == "1")           { out = SourceMode::Input1; return true; }
  if (name == "input_2" || name == "input2" || name == "2")           { out = SourceMode::Input2; return true; }
  return false;
}

// ---------------------------------------------------------------------------
// encode_set_volume_db()
// ----------------------
// Round to the nearest VOLUME_STEP_DB with ties to even (nearbyint under the
// default rounding mode), then print the magnitude as %04.1f between "'@11P-"
// and "'".
//   -3.2   -> -3.0  -> "03.0"
//   -47.75 -> -48.0 -> "48.0"   (halfway: 95.5 steps goes to the even 96)
// ---------------------------------------------------------------------------
Result encode_set_volume_db(float decibels, std::string& out) {
  if (!std::isfinite(decibels)) return Result::OutOfRange;

  const double step      = static_cast<double>(VOLUME_STEP_DB);
  const double rounded   = std::nearbyint(static_cast<double>(decibels) / step) * step;
  const double magnitude = std::fabs(rounded);  // sign dropped on purpose, see header

  std::ostringstream os;
  os << "'@11P-"
     << std::fixed << std::setprecision(1) << std::setw(4) << std::setfill('0') << magnitude
     << "'";
  out = os.str();
  return Result::Ok;
}

Result command_for_source(SourceMode mode, Command& out) {
  switch (mode) {
    case SourceMode::Auto:   out = Command::SelectInputAuto; return Result::Ok;
    case SourceMode::Input1: out = Command::SelectInput1;    return Result::Ok;
    case SourceMode::Input2: out = Command::SelectInput2;    return Result::Ok;
  }
  return Result::UnsupportedSource;
}

// Explicit branches over a table: the vocabulary is tiny and this reads
// straight through when auditing what the CLI can send.
bool name_to_command(const std::string& raw_name, Command& out) {
  const std::string name = lower(raw_name);

  if (name == "on")                        { out = Command::PowerOn;         return true; }
  if (name == "off")                       { out = Command::PowerOff;        return true; }
  if (name == "mute")                      { out = Command::MuteOn;          return true; }
  if (name == "unmute")                    { out = Command::MuteOff;         return true; }
  if (name == "toggle")                    { out = Command::MuteToggle;      return true; }
  if (name == "up" || name == "+")         { out = Command::VolumeUp;        return true; }
  if (name == "down" || name == "-")       { out = Command::VolumeDown;      return true; }
  if (name == "auto")                      { out = Command::SelectInputAuto; return true; }
  if (name == "input1")                    { out = Command::SelectInput1;    return true; }
  if (name == "input2")                    { out = Command::SelectInput2;    return true; }
  return false;
}

} // namespace fusionflex

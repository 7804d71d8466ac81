// ============================================================================
// log.cpp: implementation for log.hpp
// Default sink writes one key=value line per event to stderr.
// ============================================================================

#include "fusionflex/log.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace fusionflex {
namespace log {

namespace {

Level g_level = Level::Warn;  // quiet by default; CLI raises it with --log-level
Sink  g_sink;                 // empty => stderr

void stderr_sink(Level lvl, const std::string& text) {
  fmt::print(stderr, "level={} msg=\"{}\"\n", to_string(lvl), text);
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

void set_sink(Sink sink) { g_sink = std::move(sink); }

const char* to_string(Level lvl) {
  switch (lvl) {
    case Level::Trace: return "trace";
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "unknown";
}

bool level_from_string(const std::string& s, Level& out) {
  std::string n;
  n.reserve(s.size());
  for (char c : s) n.push_back((char)std::tolower((unsigned char)c));

  if      (n == "trace")                    out = Level::Trace;
  else if (n == "debug")                    out = Level::Debug;
  else if (n == "info")                     out = Level::Info;
  else if (n == "warn" || n == "warning")   out = Level::Warn;
  else if (n == "error")                    out = Level::Error;
  else if (n == "off" || n == "none")       out = Level::Off;
  else return false;
  return true;
}

void write(Level lvl, const std::string& text) {
  if (g_sink) g_sink(lvl, text);
  else        stderr_sink(lvl, text);
}

} // namespace log
} // namespace fusionflex

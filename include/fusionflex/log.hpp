#pragma once
/**
 * @file log.hpp
 * @brief Leveled logging for fusionflex, formatted with {fmt}.
 *
 * @details
 * The protocol engine reports what it drops (malformed chunks, unknown
 * messages, datagrams from strangers) and what happens to the link. Those
 * events go through here instead of straight to std::cerr so that:
 *   - the CLI can raise or lower verbosity at runtime (--log-level),
 *   - tests can capture lines with a custom sink and assert on them.
 *
 * Lines are rendered as `level=<lvl> msg="<text>"` to match the key=value
 * output of the CLI. Call sites pass a fmt format string:
 * @code
 *   fusionflex::log::warn("ignoring unknown message msg={}", msg);
 * @endcode
 *
 * Not thread-safe: the sink and level are process globals and are meant to be
 * set up once from main() before the event loop starts.
 */

#include <functional>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace fusionflex {
namespace log {

enum class Level : int { Trace = 0, Debug, Info, Warn, Error, Off };

/// Receives every line that passes the level filter.
using Sink = std::function<void(Level, const std::string&)>;

void  set_level(Level lvl);
Level level();

/// Replace the output sink. Passing an empty function restores stderr.
void set_sink(Sink sink);

/// Parse "trace|debug|info|warn|error|off" (case-insensitive). False if unknown.
bool level_from_string(const std::string& s, Level& out);
const char* to_string(Level lvl);

inline bool enabled(Level lvl) { return lvl >= level() && level() != Level::Off; }

void write(Level lvl, const std::string& text);

template <typename... Args>
void emit(Level lvl, fmt::format_string<Args...> f, Args&&... args) {
  if (!enabled(lvl)) return;  // skip formatting entirely when filtered
  write(lvl, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(fmt::format_string<Args...> f, Args&&... args) { emit(Level::Trace, f, std::forward<Args>(args)...); }
template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) { emit(Level::Debug, f, std::forward<Args>(args)...); }
template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args)  { emit(Level::Info,  f, std::forward<Args>(args)...); }
template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args)  { emit(Level::Warn,  f, std::forward<Args>(args)...); }
template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) { emit(Level::Error, f, std::forward<Args>(args)...); }

} // namespace log
} // namespace fusionflex

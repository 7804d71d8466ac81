#pragma once
/**
 * @file result.hpp
 * @brief Outcome codes shared by the fusionflex command surface.
 *
 * Every outbound operation on a device returns one of these by value. Nothing
 * in the library throws; callers branch on the enum and can print the stable
 * token from to_string() (e.g. "status=error reason=not_connected").
 *
 * Inbound problems (bad bytes, unknown messages) never show up here. Those are
 * dropped and logged on the receive path so the connection stays alive.
 */

#include <cstdint>

namespace fusionflex {

enum class Result : uint8_t {
  Ok = 0,
  OutOfRange,         ///< volume argument outside the codec's domain
  UnsupportedSource,  ///< source mode not in {AUTO, INPUT_1, INPUT_2}
  NotConnected,       ///< device is not in the Connected state; nothing written
  SendFailed,         ///< transport refused the write (busy); connection kept
  TransportFailed     ///< transport could not be opened, or died during a write
};

/// Stable, lowercase, script-friendly token for a Result.
const char* to_string(Result r);

inline bool ok(Result r) { return r == Result::Ok; }

} // namespace fusionflex

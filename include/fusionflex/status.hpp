#pragma once
/**
 * @file status.hpp
 * @brief Device status snapshot and the state machine that advances it.
 *
 * @details
 * A DeviceStatus is a value: once the facade publishes one it never changes.
 * Each accepted inbound frame produces a brand new snapshot from the previous
 * one (apply_message), so an observer holding a snapshot never sees a field
 * half-updated.
 *
 * Transition rules (first match wins):
 *   1. '@11[STP]-DD.F'  (F in 0/5)  -> volume_db = -DD.F
 *   2. '@112'                       -> is_turned_on = true
 *   3. '@113'                       -> is_turned_on = false
 *   4. '@15A' / '@15B' / '@15Z'     -> source_mode = INPUT_1 / INPUT_2 / AUTO
 *   5. '@11Q' / '@11R'              -> is_muted = true / false
 *   otherwise                       -> rejected, nothing published
 *
 * After any accepted frame except '@113' the device is forced on: it cannot
 * report anything while powered off, so a report implies power.
 */

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "fusionflex/command.hpp"

namespace fusionflex {

struct DeviceStatus {
  bool                      is_turned_on{true};
  std::optional<float>      volume_db;
  std::optional<SourceMode> source_mode;
  std::optional<bool>       is_muted;

  /// volume_db mapped to [0,1], or nullopt when unknown/out of range.
  std::optional<float> volume_fraction() const;

  bool operator==(const DeviceStatus& o) const {
    return is_turned_on == o.is_turned_on && volume_db == o.volume_db &&
           source_mode == o.source_mode && is_muted == o.is_muted;
  }
  bool operator!=(const DeviceStatus& o) const { return !(*this == o); }
};

/// Published snapshots are shared read-only.
using StatusSnapshot = std::shared_ptr<const DeviceStatus>;

/**
 * @brief Parse a volume report frame.
 * @return the signed level in dB (e.g. -3.0 for "'@11S-03.0'"), or nullopt when
 *         @p msg is not exactly '@11' + [STP] + '-' + 2 digits + '.' + [05] + "'".
 */
std::optional<float> parse_volume_report(const std::string& msg);

/**
 * @brief Run one complete frame through the state machine.
 *
 * @param current  last published snapshot, or nullptr before the first frame
 *                 (treated as "powered on, everything else unknown")
 * @param msg      one complete frame including delimiters
 * @return the next snapshot, or nullopt if the frame is not recognized. The
 *         input snapshot is never modified.
 */
std::optional<DeviceStatus> apply_message(const DeviceStatus* current, const std::string& msg);

/// {"is_turned_on":..,"volume_db":..|null,"source_mode":"AUTO"|..|null,"is_muted":..|null}
/// Found by nlohmann::json through ADL, so `nlohmann::json j = status;` works.
void to_json(nlohmann::json& j, const DeviceStatus& status);

} // namespace fusionflex

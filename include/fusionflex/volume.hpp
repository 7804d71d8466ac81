#pragma once
/**
 * @file volume.hpp
 * @brief Volume codec: normalized fraction [0,1] <-> attenuation in dB.
 *
 * The Fusion Flex attenuates from -95.5 dB (fully down) to 0.0 dB (full) in
 * 0.5 dB steps. Front ends usually want a slider position instead, so these
 * two pure functions map linearly between the two scales.
 *
 * Both return std::nullopt when the input is outside its domain (NaN included);
 * callers translate that into Result::OutOfRange.
 */

#include <optional>

namespace fusionflex {

static constexpr float MIN_VOLUME_DB  = -95.5f;  ///< quietest level the device accepts
static constexpr float MAX_VOLUME_DB  = 0.0f;    ///< loudest level (no attenuation)
static constexpr float VOLUME_STEP_DB = 0.5f;    ///< device resolution

/// MIN_VOLUME_DB + f * (MAX_VOLUME_DB - MIN_VOLUME_DB), or nullopt if f is not in [0,1].
std::optional<float> fraction_to_db(float fraction);

/// (d - MIN_VOLUME_DB) / (MAX_VOLUME_DB - MIN_VOLUME_DB), or nullopt if d is not in range.
std::optional<float> db_to_fraction(float decibels);

} // namespace fusionflex

#include "fusionflex/volume.hpp"

namespace fusionflex {

// NaN fails both comparisons below, so it is rejected along with real
// out-of-range values.

std::optional<float> fraction_to_db(float fraction) {
  if (!(fraction >= 0.0f && fraction <= 1.0f)) return std::nullopt;
  return MIN_VOLUME_DB + fraction * (MAX_VOLUME_DB - MIN_VOLUME_DB);
}

std::optional<float> db_to_fraction(float decibels) {
  if (!(decibels >= MIN_VOLUME_DB && decibels <= MAX_VOLUME_DB)) return std::nullopt;
  return (decibels - MIN_VOLUME_DB) / (MAX_VOLUME_DB - MIN_VOLUME_DB);
}

} // namespace fusionflex

#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vdot {

// Table column order: 5K, 10K, half marathon, marathon.
inline constexpr std::size_t kRaceCount = 4;
inline constexpr std::array<double, kRaceCount> kRaceDistances{5000.0, 10000.0, 21097.5, 42195.0};
inline constexpr double kMarathonKm = 42.195;

struct Race {
  std::string key;     // e.g., "10K"
  double distance_m;   // meters
};

// Built-in catalog, in table column order.
const std::vector<Race>& race_catalog();

// Case-insensitive lookup ("10k" == "10K").
std::optional<Race> race_by_key(const std::string& key);

enum class Zone : int {
  Easy = 0,
  Marathon,
  Threshold,
  Interval,
  Repetition,
  Count
};

// Effort band (fraction of VO2max) used for live pace ranges.
struct ZoneBand {
  Zone zone;
  const char* label;
  double effort_lo;   // slower end
  double effort_hi;   // faster end
};

const std::vector<ZoneBand>& zone_catalog();

const char* zone_label(Zone z);

} // namespace vdot

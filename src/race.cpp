#include <vdot/race.hpp>
#include <algorithm>
#include <cctype>

namespace vdot {

static inline std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<Race> make_catalog_builtin() {
  return {
    {"5K",            kRaceDistances[0]},
    {"10K",           kRaceDistances[1]},
    {"Half-Marathon", kRaceDistances[2]},
    {"Marathon",      kRaceDistances[3]},
  };
}

const std::vector<Race>& race_catalog() {
  static const std::vector<Race> cat = make_catalog_builtin();
  return cat;
}

std::optional<Race> race_by_key(const std::string& key) {
  const auto& cat = race_catalog();
  const auto K = upper(key);
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Race& r){ return upper(r.key) == K; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

const std::vector<ZoneBand>& zone_catalog() {
  static const std::vector<ZoneBand> cat{
    {Zone::Easy,       "Easy",        0.59, 0.74},
    {Zone::Marathon,   "Marathon",    0.75, 0.84},
    {Zone::Threshold,  "Threshold",   0.83, 0.88},
    {Zone::Interval,   "Interval",    0.95, 1.00},
    {Zone::Repetition, "Repetitions", 1.05, 1.20},
  };
  return cat;
}

const char* zone_label(Zone z) {
  switch (z) {
    case Zone::Easy:       return "Easy";
    case Zone::Marathon:   return "Marathon";
    case Zone::Threshold:  return "Threshold";
    case Zone::Interval:   return "Interval";
    case Zone::Repetition: return "Repetitions";
    default: return "Unknown";
  }
}

} // namespace vdot

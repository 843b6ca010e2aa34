#include <vdot/display.hpp>
#include <vdot/race.hpp>
#include <cctype>
#include <cstdio>

namespace vdot {

static constexpr double kPlausibleMin = 30.0;
static constexpr double kPlausibleMax = 85.0;

std::string format_duration(int s) {
  if (s < 0) return "-";
  const int hh = s / 3600;
  const int mm = s / 60 % 60;
  const int ss = s % 60;
  char buf[32];
  if (hh > 0) std::snprintf(buf, sizeof(buf), "%d:%02d:%02d", hh, mm, ss);
  else        std::snprintf(buf, sizeof(buf), "%d:%02d", mm, ss);
  return std::string(buf);
}

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

std::optional<int> parse_duration(const std::string& s) {
  std::vector<std::string> parts;
  std::string cur;
  for (char c : s) {
    if (c == ':') { parts.push_back(cur); cur.clear(); }
    else { cur.push_back(c); }
  }
  parts.push_back(cur);
  if (parts.size() != 2 && parts.size() != 3) return std::nullopt;
  for (const auto& p : parts) if (!all_digits(p)) return std::nullopt;

  const std::string& sec = parts.back();
  const std::string& min = parts[parts.size() - 2];
  if (sec.size() != 2) return std::nullopt;
  if (parts.size() == 3 ? min.size() != 2 : min.size() > 2) return std::nullopt;
  if (parts.size() == 3 && parts[0].size() > 6) return std::nullopt;

  const int ss = std::stoi(sec);
  const int mm = std::stoi(min);
  const int hh = parts.size() == 3 ? std::stoi(parts[0]) : 0;
  if (ss > 59 || mm > 59) return std::nullopt;
  return hh * 3600 + mm * 60 + ss;
}

Indicator classify(std::optional<double> score) {
  if (!score) return Indicator::Default;
  return (*score >= kPlausibleMin && *score <= kPlausibleMax) ? Indicator::Good : Indicator::Bad;
}

std::optional<EquivalenceRow> visible_row(std::optional<double> score,
                                          const std::optional<EquivalenceRow>& row) {
  if (classify(score) == Indicator::Bad) return std::nullopt;
  return row;
}

std::string format_score(std::optional<double> score) {
  if (!score) return "?";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", *score);
  return std::string(buf);
}

std::vector<DisplayRow> race_rows(const std::optional<EquivalenceRow>& row) {
  std::vector<DisplayRow> out;
  const auto& cat = race_catalog();
  out.reserve(cat.size());
  for (std::size_t i = 0; i < cat.size(); ++i) {
    out.push_back({cat[i].key, row ? format_duration(row->race_s[i]) : "-"});
  }
  return out;
}

std::vector<DisplayRow> pace_rows(const std::optional<EquivalenceRow>& row) {
  if (!row) {
    std::vector<DisplayRow> out;
    for (const auto& b : zone_catalog()) out.push_back({b.label, "-"});
    return out;
  }
  return {
    {zone_label(Zone::Easy),       format_duration(row->easy_fast) + " - " + format_duration(row->easy_slow)},
    {zone_label(Zone::Marathon),   format_duration(row->marathon)},
    {zone_label(Zone::Threshold),  format_duration(row->threshold)},
    {zone_label(Zone::Interval),   format_duration(row->interval)},
    {zone_label(Zone::Repetition), format_duration(row->repetition)},
  };
}

} // namespace vdot

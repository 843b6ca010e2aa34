// vdot-calc: score and equivalent performances for one race result.
//
//   vdot-calc 10K 40:00
//   vdot-calc --live 8000 31:30
//   vdot-calc --vdot=52.3

#include <vdot/calculator.hpp>
#include <vdot/display.hpp>
#include <vdot/race.hpp>
#include <vdot/store.hpp>

#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace vdot;

namespace {

struct Options {
  bool live = false;
  bool show_help = false;
  std::optional<double> score;
  std::vector<std::string> positional;
};

void print_usage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [--live] <distance> <time>\n"
            << "       " << program_name << " [--live] --vdot=SCORE\n\n"
            << "  distance   5K, 10K, Half-Marathon, Marathon or meters\n"
            << "  time       h:mm:ss or mm:ss\n"
            << "  --live     compute without the embedded table\n";
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  std::size_t idx = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &idx);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (idx != s.size()) return std::nullopt;
  return v;
}

std::optional<double> parse_distance(const std::string& s) {
  if (auto race = race_by_key(s); race.has_value()) return race->distance_m;
  const auto m = parse_double(s);
  if (!m || *m <= 0.0) return std::nullopt;
  return m;
}

void print_rows(const char* title, const std::vector<DisplayRow>& rows) {
  std::cout << "\n" << title << "\n";
  for (const auto& r : rows) {
    std::cout << "  " << std::left << std::setw(16) << r.label << r.value << "\n";
  }
}

} // namespace

int main(int argc, char* argv[]) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "--live") == 0) {
      opt.live = true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      opt.show_help = true;
    } else if (std::strncmp(arg, "--vdot=", 7) == 0) {
      opt.score = parse_double(arg + 7);
      if (!opt.score) {
        std::cerr << "[vdot] invalid score: " << (arg + 7) << "\n";
        return 2;
      }
    } else {
      opt.positional.emplace_back(arg);
    }
  }
  if (opt.show_help) { print_usage(argv[0]); return 0; }

  const PrecomputedTable* table = nullptr;
  if (!opt.live) {
    try {
      table = &embedded_table();
    } catch (const TableError& e) {
      std::cerr << "[vdot] fatal: embedded table is corrupt: " << e.what() << "\n";
      return 1;
    }
  }

  Evaluation ev{};
  if (opt.score) {
    if (!opt.positional.empty()) { print_usage(argv[0]); return 2; }
    ev = evaluate_score(*opt.score, table);
  } else {
    if (opt.positional.size() != 2) { print_usage(argv[0]); return 2; }
    const auto distance = parse_distance(opt.positional[0]);
    if (!distance) {
      std::cerr << "[vdot] unknown distance: " << opt.positional[0] << "\n";
      return 2;
    }
    const auto duration = parse_duration(opt.positional[1]);
    if (!duration || *duration <= 0) {
      std::cerr << "[vdot] invalid time: " << opt.positional[1] << "\n";
      return 2;
    }
    ev = evaluate(Performance{*distance, static_cast<double>(*duration)}, table);
  }

  const bool plausible = classify(ev.rounded_score) != Indicator::Bad;
  std::cout << "VDOT " << format_score(ev.rounded_score);
  if (!plausible) std::cout << "  (outside 30.0-85.0)";
  std::cout << "\n";

  const auto shown = visible_row(ev.rounded_score, ev.row);
  print_rows("Equivalent race performances", race_rows(shown));
  print_rows("Training paces (min/km)", pace_rows(shown));

  if (opt.live && ev.score && plausible) {
    std::cout << "\nTraining pace ranges (min/km)\n";
    for (const auto& band : zone_catalog()) {
      const PaceRange r = training_pace_range(*ev.score, band.zone);
      if (!std::isfinite(r.faster) || !std::isfinite(r.slower)) continue;
      std::cout << "  " << std::left << std::setw(16) << band.label
                << format_duration(static_cast<int>(r.faster)) << " ~ "
                << format_duration(static_cast<int>(r.slower)) << "\n";
    }
  }
  return 0;
}

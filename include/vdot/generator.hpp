#pragma once
#include <stdexcept>
#include <vdot/model.hpp>
#include <vdot/table.hpp>

namespace vdot {

// A grid point had no solution. Generation never returns a partial table.
class GenerationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct GeneratorConfig {
  int first_index = kFirstIndex;   // inclusive
  int last_index  = kLastIndex;    // inclusive
  Bracket bracket = kRaceBracket;  // minutes
  unsigned workers = 1;            // >1 splits the grid across threads
};

// Row for grid index v (score v / 10). Throws GenerationError.
EquivalenceRow generate_row(int v, Bracket bracket = kRaceBracket);

// Every index in [first_index, last_index]. Throws GenerationError.
PrecomputedTable generate_table(const GeneratorConfig& cfg = {});

} // namespace vdot

#pragma once
#include <vdot/table.hpp>

namespace vdot {

// Encoded table written by vdot-gentable at build time.
extern const char kEmbeddedTableBlob[];

// Decodes the embedded blob on first use; the same immutable table is
// returned afterwards. Throws TableError if the asset is malformed or does
// not cover the full grid.
const PrecomputedTable& embedded_table();

} // namespace vdot

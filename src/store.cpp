#include <vdot/store.hpp>
#include <vdot/codec.hpp>
#include <string>

namespace vdot {

static PrecomputedTable load_embedded_() {
  PrecomputedTable t = decode_table(kEmbeddedTableBlob);
  if (t.first_index() != kFirstIndex || t.last_index() != kLastIndex) {
    throw TableError("embedded table covers " + std::to_string(t.first_index()) + ".." +
                     std::to_string(t.last_index()) + ", expected " +
                     std::to_string(kFirstIndex) + ".." + std::to_string(kLastIndex));
  }
  return t;
}

const PrecomputedTable& embedded_table() {
  static const PrecomputedTable table = load_embedded_();
  return table;
}

} // namespace vdot

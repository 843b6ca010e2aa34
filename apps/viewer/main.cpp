#include <vdot/store.hpp>
#include <vdot/viewer/app.hpp>
#include <iostream>

using namespace vdot;

int main() {
  const PrecomputedTable* table = nullptr;
  try {
    table = &embedded_table();
  } catch (const TableError& e) {
    std::cerr << "[viewer] fatal: embedded table is corrupt: " << e.what() << "\n";
    return 1;
  }

  ViewerApp app(*table);
  return app.run();
}

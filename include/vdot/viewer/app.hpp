#pragma once
#include <cstddef>
#include <string>
#include <vdot/calculator.hpp>
#include <vdot/table.hpp>

namespace vdot {

// RAII window: event input panel on the left, equivalent races and training
// paces on the right. Output is recomputed from the input on every edit.
class ViewerApp {
public:
  explicit ViewerApp(const PrecomputedTable& table);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void recompute_();
  // Rendering
  void render_frame_();
  void draw_input_panel_(int x, int y, int w);
  void draw_results_panel_(int x, int y, int w);

  // Dependencies
  const PrecomputedTable& table_;

  // UI state
  std::size_t race_idx_{0};
  std::string time_text_;
  bool time_valid_{false};

  // Derived
  Evaluation eval_{};
};

} // namespace vdot

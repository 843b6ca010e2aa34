#include <raylib.h>
#include <string>
#include <vector>

#include <vdot/viewer/app.hpp>
#include <vdot/display.hpp>
#include <vdot/race.hpp>

namespace vdot {

namespace {

// Palette
static constexpr Color kBg        = {18, 18, 22, 255};
static constexpr Color kPanel     = {24, 24, 28, 220};
static constexpr Color kRule      = {60, 60, 70, 255};
static constexpr Color kText      = {200, 200, 210, 255};
static constexpr Color kHeader    = {220, 220, 230, 255};
static constexpr Color kHint      = {150, 160, 150, 255};
static constexpr Color kAccent    = {52, 152, 219, 255};
static constexpr Color kSuccess   = {46, 204, 113, 255};
static constexpr Color kError     = {231, 76, 60, 255};

static constexpr std::size_t kMaxTimeChars = 9; // "hhh:mm:ss"

static Color indicatorColor(Indicator ind) {
  switch (ind) {
    case Indicator::Good: return kSuccess;
    case Indicator::Bad:  return kError;
    default:              return kAccent;
  }
}

// Titled two-column table; returns the y just below it.
static int draw_table_(const char* title, const char* c1, const char* c2,
                       const std::vector<DisplayRow>& rows, int x, int y, int w) {
  const int row_h = 22;
  const int pad   = 8;
  DrawText(title, x, y, 20, kHeader);
  y += 28;

  const int box_h = pad*2 + row_h*(int(rows.size()) + 1);
  DrawRectangle(x, y, w, box_h, kPanel);
  DrawText(c1, x + pad,         y + pad, 16, kHeader);
  DrawText(c2, x + pad + w / 2, y + pad, 16, kHeader);
  DrawLine(x, y + pad + row_h - 4, x + w, y + pad + row_h - 4, kRule);

  int ry = y + pad + row_h;
  for (const auto& r : rows) {
    DrawText(r.label.c_str(), x + pad,         ry, 16, kText);
    DrawText(r.value.c_str(), x + pad + w / 2, ry, 16, kText);
    ry += row_h;
  }
  return y + box_h;
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const PrecomputedTable& table) : table_(table) {}

int ViewerApp::run() {
  const int W = 960, H = 600;
  InitWindow(W, H, "VDOT - Calculator");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  bool changed = false;

  // Event selector
  const std::size_t n = race_catalog().size();
  if (IsKeyPressed(KEY_TAB) || IsKeyPressed(KEY_DOWN)) {
    race_idx_ = (race_idx_ + 1) % n;
    changed = true;
  }
  if (IsKeyPressed(KEY_UP)) {
    race_idx_ = (race_idx_ + n - 1) % n;
    changed = true;
  }

  // Time field: digits and ':' only
  for (int ch = GetCharPressed(); ch > 0; ch = GetCharPressed()) {
    if (((ch >= '0' && ch <= '9') || ch == ':') && time_text_.size() < kMaxTimeChars) {
      time_text_.push_back(static_cast<char>(ch));
      changed = true;
    }
  }
  if (IsKeyPressed(KEY_BACKSPACE) && !time_text_.empty()) {
    time_text_.pop_back();
    changed = true;
  }
  if (IsKeyPressed(KEY_DELETE)) {
    time_text_.clear();
    changed = true;
  }

  if (changed) recompute_();
}

void ViewerApp::recompute_() {
  const auto seconds = parse_duration(time_text_);
  time_valid_ = seconds.has_value() && *seconds > 0;
  if (!time_valid_) {
    eval_ = Evaluation{};
    return;
  }
  const double distance = race_catalog()[race_idx_].distance_m;
  eval_ = evaluate(Performance{distance, static_cast<double>(*seconds)}, &table_);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(kBg);

  const int W = GetScreenWidth();
  const int left_w = int(W * 0.4f);
  draw_input_panel_(24, 24, left_w - 48);
  draw_results_panel_(left_w + 16, 24, W - left_w - 48);

  DrawText("Tab/Up/Down: Event | Type h:mm:ss or mm:ss | Backspace/Del: Edit | Esc: Quit",
           24, GetScreenHeight() - 28, 14, kHint);
  EndDrawing();
}

void ViewerApp::draw_input_panel_(int x, int y, int w) {
  // Score indicator
  const Indicator ind = classify(eval_.rounded_score);
  const std::string score = format_score(eval_.rounded_score);
  const int box_w = 110, box_h = 64;
  const int bx = x + w - box_w;
  DrawRectangleLinesEx(Rectangle{float(bx), float(y), float(box_w), float(box_h)}, 2.0f,
                       indicatorColor(ind));
  DrawText("VDOT", bx + 8, y - 8, 14, indicatorColor(ind));
  DrawText(score.c_str(), bx + (box_w - MeasureText(score.c_str(), 28)) / 2, y + 18, 28, kHeader);
  y += box_h + 24;

  // Event selector
  DrawText("Event distance", x, y, 16, kHint);
  y += 22;
  DrawRectangle(x, y, w, 36, kPanel);
  DrawRectangleLines(x, y, w, 36, kAccent);
  DrawText(race_catalog()[race_idx_].key.c_str(), x + 10, y + 9, 18, kText);
  y += 36 + 24;

  // Time field; border marks validity
  DrawText("Time (hh:mm:ss)", x, y, 16, kHint);
  y += 22;
  const Color border = time_text_.empty() ? kAccent : (time_valid_ ? kSuccess : kError);
  DrawRectangle(x, y, w, 36, kPanel);
  DrawRectangleLines(x, y, w, 36, border);
  const bool caret_on = (int(GetTime() * 2.0) % 2) == 0;
  const std::string shown = time_text_ + (caret_on ? "_" : "");
  DrawText(shown.c_str(), x + 10, y + 9, 18, kText);
}

void ViewerApp::draw_results_panel_(int x, int y, int w) {
  const auto shown = visible_row(eval_.rounded_score, eval_.row);
  y = draw_table_("Equivalent race performances", "Race", "Time",
                  race_rows(shown), x, y, w);
  draw_table_("Training paces", "Type", "Pace (min/km)",
              pace_rows(shown), x, y + 24, w);
}

} // namespace vdot

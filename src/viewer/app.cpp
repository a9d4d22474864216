#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <rline/viewer/app.hpp>
#include <rline/geometry.hpp>

namespace rline {

namespace {

// Vehicle counts cycled with N.
static const int N_CYCLE[4] = {1, 2, 3, 4};

// High-contrast palette; assigned per vehicle index.
static Color colorFor(std::size_t i) {
  static const Color PAL[] = {
    {231, 76, 60, 255},   // red
    {52, 152, 219, 255},  // blue
    {46, 204, 113, 255},  // green
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
  };
  return PAL[i % (sizeof(PAL) / sizeof(PAL[0]))];
}

// Slow = blue, fast = red.
static Color speedColor(double v, double lo, double hi) {
  const double span = hi - lo;
  float t = span > 1e-9 ? float((v - lo) / span) : 0.5f;
  t = std::clamp(t, 0.0f, 1.0f);
  return Color{ (unsigned char)(40 + 215 * t), (unsigned char)(90 + 60 * (1.0f - std::fabs(2.0f * t - 1.0f))),
                (unsigned char)(255 - 215 * t), 255 };
}

static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s <= 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

static constexpr int kHUD_LINE3_Y    = 72;
static constexpr int kHUD_BOTTOM_PAD = 24;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const RacingLineOptimizer& optimizer, Logger& log)
  : optimizer_(optimizer), log_(log), models_(optimizer.list_models()) {}

const TrackPreset& ViewerApp::preset_() const {
  return track_catalog()[preset_idx_ % track_catalog().size()];
}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y, float scale) const {
  const float cx = GetScreenWidth()  * 0.5f + pan_x_m_ * scale;
  const float cy = GetScreenHeight() * 0.5f - pan_y_m_ * scale;
  return { cx + float(x * scale), cy - float(y * scale) };
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "Racing Line - Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    if (dirty_) recompute_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;

  // Camera pan
  const float pan_step = 4.0f / scale_px_per_m_; // meters per frame while key held
  if (IsKeyDown(KEY_LEFT))  pan_x_m_ += pan_step;
  if (IsKeyDown(KEY_RIGHT)) pan_x_m_ -= pan_step;
  if (IsKeyDown(KEY_UP))    pan_y_m_ -= pan_step;
  if (IsKeyDown(KEY_DOWN))  pan_y_m_ += pan_step;
  if (IsKeyPressed(KEY_C))  dirty_ = true; // recentres

  if (IsKeyPressed(KEY_T)) { preset_idx_ = (preset_idx_ + 1) % track_catalog().size(); dirty_ = true; }
  if (IsKeyPressed(KEY_M) && !models_.empty()) { model_idx_ = (model_idx_ + 1) % models_.size(); dirty_ = true; }
  if (IsKeyPressed(KEY_N)) { n_cycle_idx_ = (n_cycle_idx_ + 1) % 4; dirty_ = true; }
}

void ViewerApp::recompute_() {
  dirty_ = false;
  const auto& preset = preset_();

  OptimizeRequest req;
  req.track_points = preset.points;
  req.track_width = preset.width;
  req.friction = preset.friction;
  req.model_id = models_.empty() ? std::string(model_key(kDefaultModel)) : models_[model_idx_].id;
  for (int i = 0; i < N_CYCLE[n_cycle_idx_]; ++i) {
    VehicleParams v;
    v.id = "car" + std::to_string(i + 1);
    req.vehicles.push_back(v);
  }

  centerline_ = preset.points;
  close_loop(centerline_);
  results_.clear();
  try {
    results_ = optimizer_.optimize(req);
  } catch (const std::exception& e) {
    log_.error("viewer: ", preset.key, " failed (", e.what(), ")");
  }

  speed_lo_ = 1e9;
  speed_hi_ = 0.0;
  for (const auto& r : results_) {
    for (double v : r.speeds) { speed_lo_ = std::min(speed_lo_, v); speed_hi_ = std::max(speed_hi_, v); }
  }
  if (speed_hi_ < speed_lo_) { speed_lo_ = 0.0; speed_hi_ = 1.0; }

  // Fit the track to the window.
  if (centerline_.empty()) return;
  double minx = 1e18, maxx = -1e18, miny = 1e18, maxy = -1e18;
  for (const auto& p : centerline_) {
    minx = std::min(minx, p.x); maxx = std::max(maxx, p.x);
    miny = std::min(miny, p.y); maxy = std::max(maxy, p.y);
  }
  pan_x_m_ = float(-0.5 * (minx + maxx));
  pan_y_m_ = float(-0.5 * (miny + maxy));
  const double span = std::max({maxx - minx, maxy - miny, 1.0}) + preset.width * 2.0;
  scale_px_per_m_ = float(0.8 * std::min(GetScreenWidth(), GetScreenHeight()) / span);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  // Grass background
  ClearBackground(Color{30, 60, 30, 255});

  draw_track_(scale_px_per_m_);
  draw_lines_(scale_px_per_m_);
  draw_results_();
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_track_(float scale_px_per_m) {
  const auto& pts = centerline_;
  if (pts.size() < 2) return;

  const float half_w_px = 0.5f * float(preset_().width) * scale_px_per_m;

  // Asphalt ribbon (thick segment lines)
  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, half_w_px*2.0f, Color{40,40,46,255});
    DrawCircleV({a.x,a.y}, half_w_px, Color{40,40,46,255});
  }
  // Centerline
  for (std::size_t i = 1; i < pts.size(); ++i) {
    auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
    auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
    DrawLineEx({a.x,a.y}, {b.x,b.y}, 1.0f, Color{90,90,100,255});
  }

  // Start/finish checker (at segment 0->1)
  auto a = worldToScreen_(pts[0].x, pts[0].y, scale_px_per_m);
  auto b = worldToScreen_(pts[1].x, pts[1].y, scale_px_per_m);
  const float dx = b.x - a.x, dy = b.y - a.y;
  const float len = std::sqrt(dx*dx + dy*dy);
  if (len > 0.1f) {
    Vector2 t = { dx / len, dy / len };
    Vector2 n = { -t.y, t.x };
    const int squares = 10;
    for (int i = 0; i < squares; ++i) {
      Color c = (i % 2 == 0) ? Color{240,240,240,255} : Color{20,20,22,255};
      float off = -half_w_px + (2.0f*half_w_px) * ((i + 0.5f) / squares);
      Vector2 p0 = { a.x + n.x * off, a.y + n.y * off };
      Vector2 p1 = { p0.x + t.x * 6.0f, p0.y + t.y * 6.0f };
      DrawLineEx(p0, p1, 4.0f, c);
    }
  }
}

void ViewerApp::draw_lines_(float scale_px_per_m) {
  for (std::size_t k = 0; k < results_.size(); ++k) {
    const auto& r = results_[k];
    const auto& pts = r.coordinates;
    for (std::size_t i = 1; i < pts.size(); ++i) {
      auto a = worldToScreen_(pts[i-1].x, pts[i-1].y, scale_px_per_m);
      auto b = worldToScreen_(pts[i].x,   pts[i].y,   scale_px_per_m);
      const double v = i - 1 < r.speeds.size() ? r.speeds[i - 1] : speed_lo_;
      DrawLineEx({a.x,a.y}, {b.x,b.y}, 3.0f, speedColor(v, speed_lo_, speed_hi_));
    }
    // Vehicle marker at the start of its line
    if (!pts.empty()) {
      auto p = worldToScreen_(pts[0].x, pts[0].y, scale_px_per_m);
      DrawCircleV({p.x, p.y}, 5.0f, colorFor(k));
    }
  }
}

void ViewerApp::draw_results_() {
  const int row_h = 18;
  const int pad   = 8;
  const int x0    = 20;
  const int y0    = kHUD_LINE3_Y + 14 + kHUD_BOTTOM_PAD;
  const int box_w = 420;
  const int box_h = pad*2 + row_h*(int(results_.size()) + 1);

  DrawRectangle(x0 - 6, y0 - 6, box_w + 12, box_h + 12, Color{0,0,0,80});
  DrawRectangle(x0, y0, box_w, box_h, Color{24,24,28,220});
  DrawLine(x0, y0 + pad + row_h, x0 + box_w, y0 + pad + row_h, Color{60,60,70,255});

  const int X_ID   = x0 + pad + 16;
  const int X_LAP  = x0 + pad + 110;
  const int X_MIN  = x0 + pad + 210;
  const int X_MAX  = x0 + pad + 300;

  const Color hdr = Color{220,220,230,255};
  DrawText("Vehicle", X_ID,  y0 + pad - 2, 16, hdr);
  DrawText("Lap",     X_LAP, y0 + pad - 2, 16, hdr);
  DrawText("Vmin",    X_MIN, y0 + pad - 2, 16, hdr);
  DrawText("Vmax",    X_MAX, y0 + pad - 2, 16, hdr);

  const Color colDefault = Color{200,200,210,255};
  const Color colFallback = Color{235,120,90,255};
  int y = y0 + pad + row_h + 2;
  char buf_lap[32];
  for (std::size_t k = 0; k < results_.size(); ++k) {
    const auto& r = results_[k];
    fmt_time(r.lap_time, buf_lap, sizeof(buf_lap));
    double lo = 0.0, hi = 0.0;
    if (!r.speeds.empty()) {
      const auto [mn, mx] = std::minmax_element(r.speeds.begin(), r.speeds.end());
      lo = *mn; hi = *mx;
    }
    const Color col = r.fallback ? colFallback : colDefault;
    DrawRectangle(x0 + pad, y+2, 10, 10, colorFor(k));
    DrawText(r.vehicle_id.c_str(), X_ID, y, 16, col);
    DrawText(buf_lap, X_LAP, y, 16, col);
    DrawText(TextFormat("%.1f", lo), X_MIN, y, 16, col);
    DrawText(TextFormat("%.1f", hi), X_MAX, y, 16, col);
    y += row_h;
  }
}

void ViewerApp::draw_hud_() {
  const auto& preset = preset_();
  const char* model = models_.empty() ? model_key(kDefaultModel) : models_[model_idx_].name.c_str();

  DrawText(TextFormat("track=%s  width=%.1fm  mu=%.2f  vehicles=%d",
                      preset.name.c_str(), preset.width, preset.friction, N_CYCLE[n_cycle_idx_]),
           20, 20, 20, Color{220,235,220,255});
  DrawText(TextFormat("model=%s  speed %.1f..%.1f m/s", model, speed_lo_, speed_hi_),
           20, 46, 18, Color{235,220,220,255});
  DrawText("W/S or +/-: Zoom | Arrows: Pan | C: Center | T: Track | M: Model | N: Vehicles",
           20, 72, 14, Color{190,205,190,255});
}

} // namespace rline

#pragma once
#include <cstddef>
#include <vector>
#include <rline/log.hpp>
#include <rline/optimizer.hpp>
#include <rline/track.hpp>

namespace rline {

// RAII application that renders the catalog tracks and the optimized lines.
// Results are recomputed only when the track, model or vehicle count changes.
class ViewerApp {
public:
  ViewerApp(const RacingLineOptimizer& optimizer, Logger& log = null_logger());
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void recompute_();
  // Rendering
  void render_frame_();
  void draw_track_(float scale_px_per_m);
  void draw_lines_(float scale_px_per_m);
  void draw_hud_();
  void draw_results_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y, float scale) const;
  const TrackPreset& preset_() const;

  // Dependencies
  const RacingLineOptimizer& optimizer_;
  Logger& log_;

  // Current solution
  std::vector<ModelInfo> models_;
  std::vector<Vec2> centerline_;
  std::vector<VehicleResult> results_;
  double speed_lo_{0.0};
  double speed_hi_{1.0};
  bool dirty_{true};

  // UI state
  std::size_t preset_idx_{0};
  std::size_t model_idx_{0};
  int n_cycle_idx_{0};
  float  scale_px_per_m_{2.0f};
  // Camera pan (meters)
  float pan_x_m_{0.0f};
  float pan_y_m_{0.0f};
};

} // namespace rline

#pragma once
#include <cstddef>
#include <vector>
#include <rline/curvilinear.hpp>
#include <rline/log.hpp>
#include <rline/speed_profile.hpp>
#include <rline/track_geometry.hpp>

namespace rline {

enum class CornerPhase { Straight, Entry, Apex, Exit, Sustained };

const char* corner_phase_name(CornerPhase p);

// Speeds below `below` use `factor`; the first matching tier wins.
struct SpeedTier {
  double below{};
  double factor{};
};

// Late-apex offset heuristic. Weights are signed relative to the inside of the
// turn: positive pulls toward the inside, negative toward the outside.
struct OffsetSettings {
  double usage_fraction = 0.40;    // max |offset| = track width * usage_fraction
  double corner_threshold = 0.003; // 1/m
  double curvature_sigma = 0.0;    // extra smoothing before classification

  int phase_window = 10;           // look-ahead / look-behind for the corner phase
  int look_ahead = 15;             // straight points searching for the next corner
  double sustained_tolerance = 0.05;

  double apex_weight = 0.9;
  double entry_weight = -0.7;
  double exit_weight = -0.6;
  double sustained_weight = 0.0;
  double setup_weight = 0.7;
  double severity_gain = 0.0;      // 0 disables the severity factor

  std::vector<SpeedTier> speed_tiers{{30.0, 1.0}, {50.0, 0.8}};
  double default_speed_factor = 0.6;

  std::vector<double> smoothing_sigmas{0.8, 1.2, 1.8};
  int refit_stride = 2;            // 0 disables the spline refit

  void validate() const;
};

// Iterative curvature-reduction pass alternating with forward-backward speeds.
struct RefinementSettings {
  bool enabled = false;
  int max_iterations = 5;
  double convergence = 0.1;      // s of lap time
  double percentile = 0.75;      // points above this curvature quantile are nudged
  double reference_speed = 50.0; // speed factor = min(v / reference_speed, max_speed_factor)
  double max_speed_factor = 2.0;

  void validate() const;
};

class OffsetSolver {
public:
  explicit OffsetSolver(OffsetSettings settings);

  const OffsetSettings& settings() const { return settings_; }
  double max_offset(double track_width) const { return track_width * settings_.usage_fraction; }

  // Curvature used for classification (geometry curvature plus extra smoothing).
  std::vector<double> classification_curvature(const TrackGeometry& geom) const;

  // Phase per point of a closed curvature sequence.
  std::vector<CornerPhase> classify(const std::vector<double>& closed_curvature) const;

  double speed_factor(double speed) const;

  // Signed lateral offset per geometry point, |n| <= max_offset(track_width),
  // last == first.
  std::vector<double> offsets(const TrackGeometry& geom, const std::vector<double>& speeds,
                              double track_width) const;

  // Map offsets through the frame and close the loop.
  static std::vector<Vec2> apply(const CurvilinearFrame& frame, const std::vector<double>& offsets);

private:
  double phase_weight_(CornerPhase p) const;
  std::vector<double> refit_(const TrackGeometry& geom, const std::vector<double>& n) const;

  OffsetSettings settings_;
};

// Rescale each point so it lies within `max_offset` of the matching centerline
// point, preserving direction.
void apply_boundary(std::vector<Vec2>& line, const std::vector<Vec2>& centerline, double max_offset);

// One curvature-reduction pass: nudge high-curvature points toward the inside
// of their turn, then boundary, moving average, boundary.
std::vector<Vec2> reduce_curvature(const std::vector<Vec2>& line, const std::vector<Vec2>& centerline,
                                   const std::vector<double>& speeds, double max_offset,
                                   const RefinementSettings& settings);

struct RefinedLine {
  std::vector<Vec2> line;
  std::vector<double> speeds;
  double lap_time{};
  int iterations{};
};

// Alternate forward-backward speed profiling with reduce_curvature and keep the
// fastest line seen.
RefinedLine refine_line(const std::vector<Vec2>& initial, const std::vector<Vec2>& centerline,
                        double half_width, double max_offset, const SpeedSolver& solver,
                        const VehicleParams& vehicle, double friction,
                        const RefinementSettings& settings, Logger& log = null_logger());

} // namespace rline

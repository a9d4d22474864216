#pragma once
#include <cstddef>
#include <vector>
#include <rline/geometry.hpp>
#include <rline/log.hpp>

namespace rline {

// Per-point geometry of a closed, resampled polyline.
// Every array has the same length as `points`; the last entry repeats the first.
struct TrackGeometry {
  std::vector<Vec2> points;
  std::vector<double> s;          // cumulative arc length, s.front() == 0
  std::vector<Vec2> tangents;     // unit
  std::vector<Vec2> normals;      // unit, left of travel
  std::vector<double> curvature;  // signed, > 0 turns left
  double half_width{0.0};

  std::size_t size() const { return points.size(); }
  bool empty() const { return points.size() < 2; }
  double length() const { return s.empty() ? 0.0 : s.back(); }
};

// Validate a raw centerline, drop coincident consecutive points and close the
// loop. Throws std::invalid_argument when fewer than 3 distinct points remain.
std::vector<Vec2> prepare_centerline(const std::vector<Vec2>& raw);

// Number of unique samples used for a centerline with `unique_points` points.
std::size_t resample_count(std::size_t unique_points, std::size_t target, std::size_t minimum);

// Fit a smooth closed curve through `closed` and return `samples` evenly
// spaced points plus the closing point. Falls back to an open fit (closure
// forced afterwards) when the periodic fit is degenerate.
std::vector<Vec2> resample_closed(const std::vector<Vec2>& closed, std::size_t samples,
                                  Logger& log = null_logger());

// Signed curvature of a closed polyline from periodic central differences.
// Non-finite values are replaced by 0.
std::vector<double> signed_curvature(const std::vector<Vec2>& closed);

// Annotate an already closed polyline (no resampling). Curvature is smoothed
// with a wrapped Gaussian of `curvature_sigma` samples.
TrackGeometry geometry_from_closed(const std::vector<Vec2>& closed, double half_width,
                                   double curvature_sigma = 1.0);

// Full pipeline: prepare, resample and annotate a raw centerline.
TrackGeometry build_track_geometry(const std::vector<Vec2>& raw, double track_width,
                                   std::size_t target_points, std::size_t min_points,
                                   Logger& log = null_logger());

} // namespace rline

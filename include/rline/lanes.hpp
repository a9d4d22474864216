#pragma once
#include <cstddef>
#include <vector>
#include <rline/curvilinear.hpp>

namespace rline {

struct LaneSettings {
  double min_separation = 3.0;     // m
  double width_fraction = 0.2;     // separation never exceeds width * width_fraction
  double spacing_margin = 1.1;     // schedule spacing = separation * margin
  double boundary_fraction = 0.45; // |lateral offset| <= width * boundary_fraction
  int max_vehicles = 6;
  std::vector<double> smoothing_sigmas{1.0, 1.5, 2.0};

  void validate() const;
};

// Minimum distance kept between neighbouring lanes on a track of this width.
double lane_separation(double track_width, const LaneSettings& settings);

// Lateral shift of each lane relative to the shared line, symmetric around 0
// and sorted from the right-most lane. Count is clamped to [1, max_vehicles].
std::vector<double> lane_schedule(std::size_t vehicles, double track_width, const LaneSettings& settings);

// Split one closed racing line (indexed like the frame's geometry) into
// parallel non-crossing lines. One vehicle returns the base line unchanged.
std::vector<std::vector<Vec2>> separate_lanes(const CurvilinearFrame& frame,
                                              const std::vector<Vec2>& base_line,
                                              double track_width, std::size_t vehicles,
                                              const LaneSettings& settings);

} // namespace rline

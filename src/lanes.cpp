#include <rline/lanes.hpp>
#include <rline/filters.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rline {

void LaneSettings::validate() const {
  if (!(min_separation > 0.0)) throw std::invalid_argument("lanes.min_separation must be positive");
  if (!(width_fraction > 0.0)) throw std::invalid_argument("lanes.width_fraction must be positive");
  if (spacing_margin < 1.0) throw std::invalid_argument("lanes.spacing_margin must be at least 1");
  if (!(boundary_fraction > 0.0) || boundary_fraction > 0.5) {
    throw std::invalid_argument("lanes.boundary_fraction must be in (0, 0.5]");
  }
  if (max_vehicles < 1) throw std::invalid_argument("lanes.max_vehicles must be at least 1");
  for (double s : smoothing_sigmas) {
    if (s < 0.0) throw std::invalid_argument("lanes.smoothing_sigmas cannot be negative");
  }
}

double lane_separation(double track_width, const LaneSettings& settings) {
  return std::min(settings.min_separation, track_width * settings.width_fraction);
}

std::vector<double> lane_schedule(std::size_t vehicles, double track_width, const LaneSettings& settings) {
  const std::size_t count = std::clamp<std::size_t>(vehicles, 1, static_cast<std::size_t>(settings.max_vehicles));
  double spacing = lane_separation(track_width, settings) * settings.spacing_margin;

  // Squeeze the band when it would not fit between the boundaries.
  const double span = spacing * double(count - 1);
  const double usable = 2.0 * track_width * settings.boundary_fraction;
  if (span > usable && span > 0.0) spacing *= usable / span;

  std::vector<double> out(count);
  const double mid = 0.5 * double(count - 1);
  for (std::size_t k = 0; k < count; ++k) out[k] = (double(k) - mid) * spacing;
  return out;
}

std::vector<std::vector<Vec2>> separate_lanes(const CurvilinearFrame& frame,
                                              const std::vector<Vec2>& base_line,
                                              double track_width, std::size_t vehicles,
                                              const LaneSettings& settings) {
  settings.validate();
  const auto schedule = lane_schedule(vehicles, track_width, settings);
  if (schedule.size() == 1) return {base_line};

  const auto& g = frame.geometry();
  if (base_line.size() != g.size()) {
    throw std::invalid_argument("base line must have one point per track sample");
  }

  // Lateral position of the shared line, centred inside the boundary so the
  // whole band fits.
  const double limit = track_width * settings.boundary_fraction;
  const double lo = -limit - schedule.front();
  const double hi = limit - schedule.back();
  std::vector<double> center(g.size());
  for (std::size_t i = 0; i < g.size(); ++i) {
    double n = dot(base_line[i] - g.points[i], g.normals[i]);
    if (!std::isfinite(n)) n = 0.0;
    center[i] = (lo <= hi) ? std::clamp(n, lo, hi) : 0.0;
  }
  center.back() = center.front();

  std::vector<std::vector<Vec2>> lanes;
  lanes.reserve(schedule.size());
  for (double shift : schedule) {
    std::vector<double> n(center.size());
    for (std::size_t i = 0; i < n.size(); ++i) n[i] = center[i] + shift;
    n = smooth_closed(n, settings.smoothing_sigmas);

    std::vector<Vec2> line;
    line.reserve(n.size());
    for (std::size_t i = 0; i < n.size(); ++i) line.push_back(frame.position_at(g.s[i], n[i]));
    close_loop(line);
    lanes.push_back(std::move(line));
  }
  return lanes;
}

} // namespace rline

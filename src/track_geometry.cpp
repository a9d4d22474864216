#include <rline/track_geometry.hpp>
#include <rline/filters.hpp>
#include <rline/spline.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rline {

namespace {

constexpr double kCurvatureDenomFloor = 1e-10;

} // namespace

std::vector<Vec2> prepare_centerline(const std::vector<Vec2>& raw) {
  if (raw.size() < 3) throw std::invalid_argument("track must contain at least 3 points");

  std::vector<Vec2> pts;
  pts.reserve(raw.size() + 1);
  for (const auto& p : raw) {
    if (!is_finite(p)) throw std::invalid_argument("track points must be finite");
    if (!pts.empty() && distance(pts.back(), p) < kCoincidentTol) continue;
    pts.push_back(p);
  }
  // A trailing copy of the first point is closure, not a distinct point.
  while (pts.size() > 1 && nearly_equal(pts.front(), pts.back())) pts.pop_back();
  if (pts.size() < 3) throw std::invalid_argument("track must contain at least 3 points");

  close_loop(pts);
  return pts;
}

std::size_t resample_count(std::size_t unique_points, std::size_t target, std::size_t minimum) {
  const std::size_t m = std::min(target, std::max(unique_points, minimum));
  return std::max<std::size_t>(m, 3);
}

std::vector<Vec2> resample_closed(const std::vector<Vec2>& closed, std::size_t samples, Logger& log) {
  if (auto fitted = fit_periodic_polyline(closed, samples)) {
    close_loop(*fitted, 0.0);
    return *fitted;
  }

  log.warn("periodic spline fit failed on ", closed.size(), " points; using open fit");
  // Open fit over samples+1 parameters, the last of which lands on the start.
  if (auto fitted = fit_open_polyline(closed, samples + 1)) {
    fitted->back() = fitted->front();
    return *fitted;
  }

  log.warn("open spline fit failed; keeping input polyline");
  std::vector<Vec2> out = closed;
  close_loop(out);
  return out;
}

std::vector<double> signed_curvature(const std::vector<Vec2>& closed) {
  std::vector<double> k(closed.size(), 0.0);
  if (closed.size() < 4) return k;

  const std::size_t n = closed.size() - 1;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& prev = closed[(i + n - 1) % n];
    const Vec2& cur  = closed[i];
    const Vec2& next = closed[(i + 1) % n];

    const Vec2 d1 = (next - prev) * 0.5;
    const Vec2 d2 = next - cur * 2.0 + prev;
    const double speed2 = d1.x * d1.x + d1.y * d1.y;
    const double denom = std::max(std::pow(speed2, 1.5), kCurvatureDenomFloor);
    const double kappa = cross(d1, d2) / denom;
    k[i] = std::isfinite(kappa) ? kappa : 0.0;
  }
  k[n] = k[0];
  return k;
}

TrackGeometry geometry_from_closed(const std::vector<Vec2>& closed, double half_width,
                                   double curvature_sigma) {
  TrackGeometry g;
  g.points = closed;
  g.half_width = half_width;
  const std::size_t count = g.points.size();
  if (count < 2) return g;

  g.s.assign(count, 0.0);
  for (std::size_t i = 1; i < count; ++i) {
    g.s[i] = g.s[i - 1] + distance(g.points[i - 1], g.points[i]);
  }

  g.tangents.assign(count, Vec2{1.0, 0.0});
  g.normals.assign(count, Vec2{0.0, 1.0});
  const std::size_t n = is_closed(g.points) ? count - 1 : count;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 t = normalized(g.points[(i + 1) % n] - g.points[(i + n - 1) % n]);
    if (norm(t) == 0.0) continue;
    g.tangents[i] = t;
    g.normals[i] = perp(t);
  }
  if (n < count) {
    g.tangents.back() = g.tangents.front();
    g.normals.back() = g.normals.front();
  }

  g.curvature = smooth_closed(signed_curvature(g.points), curvature_sigma);
  sanitize(g.curvature, 0.0);
  return g;
}

TrackGeometry build_track_geometry(const std::vector<Vec2>& raw, double track_width,
                                   std::size_t target_points, std::size_t min_points,
                                   Logger& log) {
  if (!(track_width > 0.0) || !std::isfinite(track_width)) {
    throw std::invalid_argument("track width must be positive");
  }
  const auto closed = prepare_centerline(raw);
  const std::size_t samples = resample_count(closed.size() - 1, target_points, min_points);
  const auto resampled = resample_closed(closed, samples, log);
  log.debug("resampled centerline: ", closed.size() - 1, " -> ", resampled.size() - 1, " points");
  return geometry_from_closed(resampled, 0.5 * track_width);
}

} // namespace rline

#include <rline/curvilinear.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace rline {

CurvilinearFrame::CurvilinearFrame(TrackGeometry geometry) : geom_(std::move(geometry)) {
  if (geom_.empty() || geom_.s.size() != geom_.size() || geom_.normals.size() != geom_.size()
      || geom_.tangents.size() != geom_.size() || geom_.curvature.size() != geom_.size()) {
    throw std::invalid_argument("curvilinear frame needs a complete track geometry");
  }
}

CurvilinearFrame::Lookup CurvilinearFrame::locate_(double s) const {
  const auto& sp = geom_.s;
  const double sc = std::clamp(s, 0.0, length());

  auto it = std::upper_bound(sp.begin(), sp.end(), sc);
  std::size_t i1 = std::clamp<std::size_t>(std::distance(sp.begin(), it), 1, sp.size() - 1);
  std::size_t i0 = i1 - 1;

  const double seg_len = sp[i1] - sp[i0];
  const double t = (seg_len > 0.0) ? std::clamp((sc - sp[i0]) / seg_len, 0.0, 1.0) : 0.0;
  return {i0, i1, t};
}

CurvilinearState CurvilinearFrame::to_curvilinear(Vec2 position, double heading) const {
  const auto& pts = geom_.points;
  double best_d2 = std::numeric_limits<double>::infinity();
  CurvilinearState out;

  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    const Vec2 a = pts[i];
    const Vec2 d = pts[i + 1] - a;
    const double len2 = dot(d, d);
    const double t = (len2 > 0.0) ? std::clamp(dot(position - a, d) / len2, 0.0, 1.0) : 0.0;
    const Vec2 foot = a + d * t;
    const Vec2 off = position - foot;
    const double d2 = dot(off, off);
    if (d2 >= best_d2) continue;

    best_d2 = d2;
    const Vec2 dir = (len2 > 0.0) ? normalized(d) : geom_.tangents[i];
    const double side = cross(dir, off);
    out.s = geom_.s[i] + t * (geom_.s[i + 1] - geom_.s[i]);
    out.n = (side < 0.0 ? -1.0 : 1.0) * std::sqrt(d2);
    out.xi = wrap_angle(heading - std::atan2(dir.y, dir.x));
  }
  return out;
}

GlobalPose CurvilinearFrame::to_global(const CurvilinearState& state) const {
  const auto k = locate_(state.s);
  const Vec2 center = lerp(geom_.points[k.i0], geom_.points[k.i1], k.t);
  Vec2 normal = normalized(lerp(geom_.normals[k.i0], geom_.normals[k.i1], k.t));
  Vec2 tangent = normalized(lerp(geom_.tangents[k.i0], geom_.tangents[k.i1], k.t));
  if (norm(tangent) == 0.0) tangent = geom_.tangents[k.i0];
  if (norm(normal) == 0.0) normal = perp(tangent);

  GlobalPose pose;
  pose.position = center + normal * state.n;
  pose.heading = wrap_angle(std::atan2(tangent.y, tangent.x) + state.xi);
  return pose;
}

Vec2 CurvilinearFrame::position_at(double s, double n) const {
  return to_global(CurvilinearState{s, n, 0.0}).position;
}

double CurvilinearFrame::curvature_at(double s) const {
  const auto k = locate_(s);
  const double kappa = geom_.curvature[k.i0] + (geom_.curvature[k.i1] - geom_.curvature[k.i0]) * k.t;
  return std::isfinite(kappa) ? kappa : 0.0;
}

TrackProperties CurvilinearFrame::properties_at(double s, double corner_threshold) const {
  TrackProperties p;
  p.curvature = curvature_at(s);
  const double mag = std::fabs(p.curvature);
  p.radius = (mag > 0.0) ? 1.0 / mag : std::numeric_limits<double>::infinity();
  p.is_corner = mag > corner_threshold;
  if (p.is_corner) {
    p.direction = (p.curvature > 0.0) ? TurnDirection::Left : TurnDirection::Right;
  }
  return p;
}

bool CurvilinearFrame::contains(double s, double n) const {
  return s >= 0.0 && s <= length() && std::fabs(n) <= geom_.half_width;
}

CurvilinearRates CurvilinearFrame::kinematics(const CurvilinearState& state, double u, double v,
                                              double omega) const {
  const double kappa = curvature_at(state.s);
  double metric = 1.0 - state.n * kappa;
  if (std::fabs(metric) < kMetricFloor) metric = (metric < 0.0) ? -kMetricFloor : kMetricFloor;

  CurvilinearRates r;
  r.s_dot = (u * std::cos(state.xi) - v * std::sin(state.xi)) / metric;
  r.n_dot = u * std::sin(state.xi) + v * std::cos(state.xi);
  r.xi_dot = omega - kappa * r.s_dot;
  return r;
}

} // namespace rline

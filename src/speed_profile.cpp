#include <rline/speed_profile.hpp>
#include <rline/filters.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace rline {

const char* speed_method_name(SpeedMethod m) {
  switch (m) {
    case SpeedMethod::ClosedForm:      return "closed_form";
    case SpeedMethod::ForwardBackward: return "forward_backward";
  }
  return "?";
}

void SpeedSettings::validate() const {
  if (!(min_speed > 0.0) || !(max_speed >= min_speed)) {
    throw std::invalid_argument("speed window must satisfy 0 < min_speed <= max_speed");
  }
  if (smoothing_sigma < 0.0) throw std::invalid_argument("speed smoothing sigma cannot be negative");
  if (!(brake_force_ratio > 0.0)) throw std::invalid_argument("brake_force_ratio must be positive");
  if (!(accel_lateral_scale > 0.0) || !(brake_lateral_scale > 0.0)) {
    throw std::invalid_argument("lateral demand scales must be positive");
  }
  if (accel_max_loss < 0.0 || accel_max_loss >= 1.0 || brake_max_loss < 0.0 || brake_max_loss >= 1.0) {
    throw std::invalid_argument("lateral demand losses must be in [0, 1)");
  }
}

SpeedSolver::SpeedSolver(const AeroModel& aero, SpeedSettings settings)
  : aero_(aero), settings_(settings) {
  settings_.validate();
}

double SpeedSolver::straight_speed(const VehicleParams& vehicle) const {
  const double drive = vehicle.mass * vehicle.max_acceleration;
  return aero_.drag_limited_speed(drive, vehicle.effective_frontal_area(), vehicle.drag_coefficient);
}

double SpeedSolver::corner_speed(double kappa, const VehicleParams& vehicle, double friction) const {
  const double k = std::fabs(kappa);
  if (!(k > kStraightCurvature) || !std::isfinite(k)) return straight_speed(vehicle);

  const double radius = 1.0 / k;
  if (radius < vehicle.min_turn_radius()) {
    return std::min(kSteeringLimitedSpeed, std::sqrt(friction * kGravity * radius));
  }

  const double area = vehicle.effective_frontal_area();
  const double weight = vehicle.mass * kGravity;
  double v = kCornerInitialSpeed;
  for (int it = 0; it < kCornerMaxIterations; ++it) {
    const auto f = aero_.forces(v, area, vehicle.drag_coefficient, vehicle.lift_coefficient);
    const double v2 = friction * (weight + f.downforce) / (vehicle.mass * k);
    if (!(v2 > 0.0) || !std::isfinite(v2)) break;
    const double next = std::sqrt(v2);
    if (std::fabs(next - v) < kCornerTolerance) break;
    v = kCornerDamping * v + (1.0 - kCornerDamping) * next;
  }
  return v;
}

std::vector<double> SpeedSolver::steady_state(const TrackGeometry& geom, const VehicleParams& vehicle,
                                              double friction) const {
  std::vector<double> v(geom.size(), settings_.min_speed);
  const double top = straight_speed(vehicle);
  for (std::size_t i = 0; i < geom.size(); ++i) {
    const double kappa = geom.curvature[i];
    // A corner is never taken faster than the drag-limited top speed.
    const double raw = (std::fabs(kappa) > kStraightCurvature)
                         ? std::min(corner_speed(kappa, vehicle, friction), top) : top;
    v[i] = std::clamp(std::isfinite(raw) ? raw : settings_.min_speed,
                      settings_.min_speed, settings_.max_speed);
  }
  return v;
}

std::vector<double> SpeedSolver::finish_(std::vector<double> closed) const {
  sanitize(closed, settings_.min_speed);
  closed = smooth_closed(closed, settings_.smoothing_sigma);
  for (auto& x : closed) {
    x = std::isfinite(x) ? std::clamp(x, settings_.min_speed, settings_.max_speed) : settings_.min_speed;
  }
  if (closed.size() > 1) closed.back() = closed.front();
  return closed;
}

std::vector<double> SpeedSolver::closed_form(const TrackGeometry& geom, const VehicleParams& vehicle,
                                             double friction) const {
  return finish_(steady_state(geom, vehicle, friction));
}

std::vector<double> SpeedSolver::forward_backward(const TrackGeometry& geom, const VehicleParams& vehicle,
                                                  double friction) const {
  const auto steady = steady_state(geom, vehicle, friction);
  if (geom.size() < 4) return finish_(steady);

  const std::size_t n = geom.size() - 1; // unique points
  std::vector<double> ds(n);
  for (std::size_t i = 0; i < n; ++i) ds[i] = std::max(0.0, geom.s[i + 1] - geom.s[i]);

  const double m = vehicle.mass;
  const double accel_force = m * vehicle.max_acceleration;
  const double brake_force = settings_.brake_force_ratio * accel_force;

  // Start at the slowest point so both passes wrap around the closed lap.
  const auto start = static_cast<std::size_t>(
      std::distance(steady.begin(), std::min_element(steady.begin(), steady.begin() + n)));

  std::vector<double> fwd(steady.begin(), steady.begin() + n);
  for (std::size_t j = 1; j < n; ++j) {
    const std::size_t i = (start + j) % n;
    const std::size_t prev = (i + n - 1) % n;
    const double lat = fwd[prev] * fwd[prev] * std::fabs(geom.curvature[prev]);
    const double loss = std::min(lat / settings_.accel_lateral_scale, settings_.accel_max_loss);
    const double v2 = fwd[prev] * fwd[prev] + 2.0 * accel_force * (1.0 - loss) * ds[prev] / m;
    fwd[i] = std::min(std::sqrt(std::max(v2, 0.0)), steady[i]);
  }

  std::vector<double> out = fwd;
  for (std::size_t j = 1; j < n; ++j) {
    const std::size_t i = (start + n - j) % n;
    const std::size_t next = (i + 1) % n;
    const double lat = out[next] * out[next] * std::fabs(geom.curvature[next]);
    const double loss = std::min(lat / settings_.brake_lateral_scale, settings_.brake_max_loss);
    const double v2 = out[next] * out[next] + 2.0 * brake_force * (1.0 - loss) * ds[i] / m;
    out[i] = std::min(std::sqrt(std::max(v2, 0.0)), fwd[i]);
  }

  out.push_back(out.front());
  return finish_(std::move(out));
}

std::vector<double> SpeedSolver::speeds(const TrackGeometry& geom, const VehicleParams& vehicle,
                                        double friction) const {
  switch (settings_.method) {
    case SpeedMethod::ClosedForm:      return closed_form(geom, vehicle, friction);
    case SpeedMethod::ForwardBackward: return forward_backward(geom, vehicle, friction);
  }
  return closed_form(geom, vehicle, friction);
}

double lap_time(const std::vector<Vec2>& closed, const std::vector<double>& speeds) {
  const std::size_t count = std::min(closed.size(), speeds.size());
  double t = 0.0;
  for (std::size_t i = 0; i + 1 < count; ++i) {
    const double seg = std::max(distance(closed[i], closed[i + 1]), kMinSegmentLength);
    const double avg = 0.5 * (speeds[i] + speeds[i + 1]);
    if (!(avg > 0.0) || !std::isfinite(avg) || !std::isfinite(seg)) continue;
    t += seg / avg;
  }
  return t;
}

} // namespace rline

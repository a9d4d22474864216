#include <rline/aero.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace rline {

void AeroConfig::validate() const {
  if (!(air_density > 0.0) || !std::isfinite(air_density)) {
    throw std::invalid_argument("aero.air_density must be positive");
  }
  if (speeds.size() < 2) {
    throw std::invalid_argument("aero.speeds needs at least 2 samples");
  }
  for (std::size_t i = 1; i < speeds.size(); ++i) {
    if (!(speeds[i] > speeds[i - 1])) {
      throw std::invalid_argument("aero.speeds must be strictly increasing");
    }
  }
  auto check_table = [&](const std::vector<double>& t, const char* name) {
    if (t.size() != speeds.size()) {
      throw std::invalid_argument(std::string("aero.") + name + " must match aero.speeds in length");
    }
    for (double v : t) {
      if (!std::isfinite(v)) throw std::invalid_argument(std::string("aero.") + name + " must be finite");
    }
  };
  check_table(drag, "drag");
  check_table(lift, "lift");
  check_table(center_of_pressure, "center_of_pressure");

  if (!(reference_drag > 0.0) || !(reference_lift > 0.0)) {
    throw std::invalid_argument("aero reference coefficients must be positive");
  }
  if (min_drag > max_drag || min_lift > max_lift || min_cop > max_cop) {
    throw std::invalid_argument("aero clamp windows must satisfy min <= max");
  }
  if (!(min_drag > 0.0)) {
    throw std::invalid_argument("aero.min_drag must be positive");
  }
  if (!(max_lookup_speed > 0.0)) {
    throw std::invalid_argument("aero.max_lookup_speed must be positive");
  }
  if (max_iterations < 1) {
    throw std::invalid_argument("aero.max_iterations must be at least 1");
  }
  if (!(tolerance > 0.0)) {
    throw std::invalid_argument("aero.tolerance must be positive");
  }
  if (!(min_top_speed > 0.0) || min_top_speed > max_top_speed) {
    throw std::invalid_argument("aero top speed window must satisfy 0 < min <= max");
  }
}

static const AeroConfig& validated_(const AeroConfig& c) {
  c.validate();
  return c;
}

static CubicSpline make_map_(const std::vector<double>& x, const std::vector<double>& y) {
  auto s = CubicSpline::natural(x, y);
  if (!s) throw std::invalid_argument("aero map could not be interpolated");
  return *s;
}

AeroModel::AeroModel(AeroConfig config)
  : config_(validated_(config)),
    drag_(make_map_(config_.speeds, config_.drag)),
    lift_(make_map_(config_.speeds, config_.lift)),
    cop_(make_map_(config_.speeds, config_.center_of_pressure)) {}

AeroCoefficients AeroModel::coefficients(double speed) const {
  const double v = std::isfinite(speed) ? std::clamp(speed, 0.0, config_.max_lookup_speed) : 0.0;
  AeroCoefficients c;
  c.drag = std::clamp(drag_(v), config_.min_drag, config_.max_drag);
  c.lift = std::clamp(lift_(v), config_.min_lift, config_.max_lift);
  c.center_of_pressure = std::clamp(cop_(v), config_.min_cop, config_.max_cop);
  return c;
}

double AeroModel::drag_coefficient_(double speed, std::optional<double> drag_override) const {
  double cd = coefficients(speed).drag;
  if (drag_override) cd *= *drag_override / config_.reference_drag;
  return cd;
}

AeroForces AeroModel::forces(double speed, double frontal_area,
                             std::optional<double> drag_override,
                             std::optional<double> lift_override) const {
  const auto c = coefficients(speed);
  double cd = c.drag;
  double cl = c.lift;
  if (drag_override) cd *= *drag_override / config_.reference_drag;
  if (lift_override) cl *= *lift_override / config_.reference_lift;

  const double q = 0.5 * config_.air_density * speed * speed * frontal_area;
  AeroForces f;
  f.drag = q * cd;
  f.downforce = q * cl;
  if (!std::isfinite(f.drag)) f.drag = 0.0;
  if (!std::isfinite(f.downforce)) f.downforce = 0.0;
  return f;
}

double AeroModel::drag_limited_speed(double available_force, double frontal_area,
                                     std::optional<double> drag_override) const {
  double v = config_.initial_speed;
  if (!(available_force > 0.0) || !(frontal_area > 0.0)) {
    return std::clamp(v, config_.min_top_speed, config_.max_top_speed);
  }

  for (int it = 0; it < config_.max_iterations; ++it) {
    const double cd = drag_coefficient_(v, drag_override);
    if (!(cd > 0.0)) break;
    const double next = std::sqrt(2.0 * available_force / (config_.air_density * cd * frontal_area));
    if (!std::isfinite(next)) break;
    if (std::fabs(next - v) < config_.tolerance) break;
    v = next;
  }
  return std::clamp(v, config_.min_top_speed, config_.max_top_speed);
}

} // namespace rline

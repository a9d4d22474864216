#include <rline/vehicle.hpp>
#include <rline/geometry.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace rline {

static void require_positive_(double v, const char* what) {
  if (!(v > 0.0) || !std::isfinite(v)) {
    throw std::invalid_argument(std::string("vehicle.") + what + " must be positive");
  }
}

void VehicleParams::validate() const {
  if (id.empty()) throw std::invalid_argument("vehicle.id must not be empty");
  require_positive_(mass, "mass");
  require_positive_(length, "length");
  require_positive_(width, "width");
  require_positive_(max_acceleration, "max_acceleration");
  require_positive_(drag_coefficient, "drag_coefficient");
  require_positive_(lift_coefficient, "lift_coefficient");
  if (frontal_area) require_positive_(*frontal_area, "frontal_area");
  if (!(max_steering_angle_deg > 0.0 && max_steering_angle_deg < 90.0)) {
    throw std::invalid_argument("vehicle.max_steering_angle must be in (0, 90) degrees");
  }
}

double VehicleParams::effective_frontal_area() const {
  if (frontal_area) return *frontal_area;
  return length * width * 0.7;
}

double VehicleParams::min_turn_radius() const {
  const double steer = max_steering_angle_deg * kPI / 180.0;
  return wheelbase() / std::tan(steer);
}

} // namespace rline

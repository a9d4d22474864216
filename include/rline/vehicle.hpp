#pragma once
#include <optional>
#include <string>

namespace rline {

// Physical description of one car. Defaults match a 750 kg open-wheeler.
struct VehicleParams {
  std::string id{"car"};
  double mass = 750.0;                   // kg
  double length = 5.0;                   // m
  double width = 1.4;                    // m
  double max_steering_angle_deg = 30.0;  // (0, 90)
  double max_acceleration = 5.0;         // m/s^2
  double drag_coefficient = 1.0;
  double lift_coefficient = 3.0;
  std::optional<double> frontal_area;    // m^2, derived when absent

  // Throws std::invalid_argument naming the offending field.
  void validate() const;

  // length * width * 0.7 unless a frontal area was supplied.
  double effective_frontal_area() const;

  double wheelbase() const { return 0.6 * length; }

  // Tightest radius the steering lock allows: wheelbase / tan(max steer).
  double min_turn_radius() const;
};

} // namespace rline

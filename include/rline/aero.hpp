#pragma once
#include <optional>
#include <vector>
#include <rline/spline.hpp>

namespace rline {

// Speed-dependent aerodynamic maps and the clamp windows applied to them.
struct AeroConfig {
  double air_density = 1.225; // kg/m^3

  std::vector<double> speeds{0.0, 20.0, 40.0, 60.0, 80.0, 100.0};   // m/s
  std::vector<double> drag{1.0, 1.2, 1.4, 1.6, 1.8, 2.0};
  std::vector<double> lift{0.5, 1.5, 2.5, 3.2, 3.7, 4.0};
  std::vector<double> center_of_pressure{2.5, 2.6, 2.7, 2.8, 2.9, 3.0}; // m from front axle

  // Vehicle coefficients are applied as ratios against these references.
  double reference_drag = 1.0;
  double reference_lift = 3.0;

  double max_lookup_speed = 120.0;
  double min_drag = 0.3, max_drag = 3.0;
  double min_lift = 0.5, max_lift = 8.0;
  double min_cop  = 2.0, max_cop  = 3.5;

  // Drag-limited top speed solver.
  double initial_speed = 50.0;
  int max_iterations = 10;
  double tolerance = 0.1;
  double min_top_speed = 10.0;
  double max_top_speed = 120.0;

  void validate() const;
};

struct AeroCoefficients {
  double drag{};
  double lift{};
  double center_of_pressure{};
};

struct AeroForces {
  double drag{};
  double downforce{};
};

class AeroModel {
public:
  explicit AeroModel(AeroConfig config = {});

  // Coefficients at `speed` (clamped to [0, max_lookup_speed]), each clamped
  // to its plausible window.
  AeroCoefficients coefficients(double speed) const;

  // F = 0.5 * rho * v^2 * C * A. Overrides scale the maps by
  // override / reference.
  AeroForces forces(double speed, double frontal_area,
                    std::optional<double> drag_override = std::nullopt,
                    std::optional<double> lift_override = std::nullopt) const;

  // Speed at which drag balances `available_force`, by fixed-point iteration.
  double drag_limited_speed(double available_force, double frontal_area,
                            std::optional<double> drag_override = std::nullopt) const;

  const AeroConfig& config() const { return config_; }

private:
  double drag_coefficient_(double speed, std::optional<double> drag_override) const;

  AeroConfig config_;
  CubicSpline drag_;
  CubicSpline lift_;
  CubicSpline cop_;
};

} // namespace rline

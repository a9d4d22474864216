#pragma once
#include <cstddef>
#include <vector>
#include <rline/aero.hpp>
#include <rline/track_geometry.hpp>
#include <rline/vehicle.hpp>

namespace rline {

enum class SpeedMethod {
  ClosedForm,      // per-point corner / straight physics
  ForwardBackward, // steady state, then acceleration and braking passes
};

const char* speed_method_name(SpeedMethod m);

// Curvature below this is a straight for the speed solvers.
inline constexpr double kStraightCurvature = 1e-6;
// Segment lengths used for timing never drop below this.
inline constexpr double kMinSegmentLength = 0.1;

// Corner fixed-point iteration.
inline constexpr double kCornerInitialSpeed = 30.0;
inline constexpr int    kCornerMaxIterations = 5;
inline constexpr double kCornerTolerance = 0.5;
inline constexpr double kCornerDamping = 0.7; // weight kept from the previous estimate
// Corners tighter than the steering lock allows are capped at this speed.
inline constexpr double kSteeringLimitedSpeed = 15.0;

struct SpeedSettings {
  SpeedMethod method = SpeedMethod::ClosedForm;
  double min_speed = 5.0;    // floor, m/s
  double max_speed = 100.0;  // ceiling, m/s
  double smoothing_sigma = 2.0;

  // Forward-backward only.
  double brake_force_ratio = 3.0;
  double accel_lateral_scale = 50.0;   // m/s^2 of lateral demand per unit of loss
  double accel_max_loss = 0.3;
  double brake_lateral_scale = 30.0;
  double brake_max_loss = 0.4;

  void validate() const;
};

// Speed profile solver shared by every model. Output arrays have one entry per
// geometry point and respect [min_speed, max_speed].
class SpeedSolver {
public:
  SpeedSolver(const AeroModel& aero, SpeedSettings settings);

  const SpeedSettings& settings() const { return settings_; }

  // Grip-limited speed for curvature `kappa`, including downforce.
  double corner_speed(double kappa, const VehicleParams& vehicle, double friction) const;

  // Drag-limited top speed with the full drive force m * a_max.
  double straight_speed(const VehicleParams& vehicle) const;

  // Unsmoothed per-point steady-state speed, clamped to the window.
  std::vector<double> steady_state(const TrackGeometry& geom, const VehicleParams& vehicle,
                                   double friction) const;

  std::vector<double> closed_form(const TrackGeometry& geom, const VehicleParams& vehicle,
                                  double friction) const;

  std::vector<double> forward_backward(const TrackGeometry& geom, const VehicleParams& vehicle,
                                       double friction) const;

  // Dispatch on settings().method.
  std::vector<double> speeds(const TrackGeometry& geom, const VehicleParams& vehicle,
                             double friction) const;

private:
  std::vector<double> finish_(std::vector<double> closed) const;

  const AeroModel& aero_;
  SpeedSettings settings_;
};

// Sum of segment length over mean segment speed around a closed polyline.
double lap_time(const std::vector<Vec2>& closed, const std::vector<double>& speeds);

} // namespace rline

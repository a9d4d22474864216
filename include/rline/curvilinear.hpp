#pragma once
#include <cstddef>
#include <vector>
#include <rline/geometry.hpp>
#include <rline/track_geometry.hpp>

namespace rline {

// Track-relative position: arc length, signed lateral offset (left of travel
// is positive) and heading relative to the local tangent.
struct CurvilinearState {
  double s{};
  double n{};
  double xi{};
};

struct GlobalPose {
  Vec2 position{};
  double heading{}; // radians
};

// Time derivatives of (s, n, xi) for a body moving with longitudinal speed u,
// lateral speed v and yaw rate omega.
struct CurvilinearRates {
  double s_dot{};
  double n_dot{};
  double xi_dot{};
};

enum class TurnDirection { Straight, Left, Right };

struct TrackProperties {
  double curvature{};
  double radius{};   // infinity on straights
  bool is_corner{};
  TurnDirection direction{TurnDirection::Straight};
};

inline constexpr double kDefaultCornerThreshold = 0.001;
// Lower bound on |1 - n*kappa| in the curvilinear metric.
inline constexpr double kMetricFloor = 1e-6;

// Read-only frame built once per request from the processed centerline.
class CurvilinearFrame {
public:
  explicit CurvilinearFrame(TrackGeometry geometry);

  const TrackGeometry& geometry() const { return geom_; }
  double length() const { return geom_.length(); }
  double half_width() const { return geom_.half_width; }

  // Nearest-point projection onto the centerline polyline.
  CurvilinearState to_curvilinear(Vec2 position, double heading = 0.0) const;

  // s is clamped to [0, length].
  GlobalPose to_global(const CurvilinearState& state) const;
  Vec2 position_at(double s, double n = 0.0) const;

  double curvature_at(double s) const;
  TrackProperties properties_at(double s, double corner_threshold = kDefaultCornerThreshold) const;

  // True when 0 <= s <= length and |n| <= half width.
  bool contains(double s, double n) const;

  CurvilinearRates kinematics(const CurvilinearState& state, double u, double v, double omega) const;

private:
  struct Lookup {
    std::size_t i0{};
    std::size_t i1{};
    double t{};
  };
  Lookup locate_(double s) const;

  TrackGeometry geom_;
};

} // namespace rline

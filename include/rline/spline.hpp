#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rline/geometry.hpp>

namespace rline {

// Interpolating cubic spline y(x) over strictly increasing knots.
// Natural splines extrapolate with their end pieces; periodic splines wrap
// x into [front, back).
class CubicSpline {
public:
  // Needs >= 2 knots. Returns nullopt on non-increasing knots or a singular system.
  static std::optional<CubicSpline> natural(std::vector<double> x, std::vector<double> y);

  // Knots x_0..x_m with y_m == y_0; needs m >= 3 distinct intervals.
  static std::optional<CubicSpline> periodic(std::vector<double> x, std::vector<double> y);

  double operator()(double t) const;

  double front() const { return x_.front(); }
  double back() const { return x_.back(); }
  bool is_periodic() const { return periodic_; }

private:
  CubicSpline() = default;
  std::size_t interval_(double t) const;

  std::vector<double> x_;
  std::vector<double> y_;
  std::vector<double> m_; // second derivatives at the knots
  bool periodic_{false};
};

// Fit a periodic chord-length parameterized spline through a closed polyline
// (first == last) and evaluate `samples` evenly spaced parameters. The result
// is open: callers append the closing point themselves.
std::optional<std::vector<Vec2>> fit_periodic_polyline(const std::vector<Vec2>& closed,
                                                       std::size_t samples);

// Non-periodic (natural) variant; evaluates `samples` parameters spanning the
// whole curve, endpoints included.
std::optional<std::vector<Vec2>> fit_open_polyline(const std::vector<Vec2>& pts,
                                                   std::size_t samples);

} // namespace rline

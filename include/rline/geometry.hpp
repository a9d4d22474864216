#pragma once
#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

namespace rline {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kGravity = 9.81;

// Points closer than this are treated as the same point.
inline constexpr double kCoincidentTol = 1e-9;
// Tolerance used when checking first == last on closed polylines.
inline constexpr double kClosureTol = 1e-3;

struct Vec2 {
  double x{};
  double y{};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }
inline Vec2 operator*(double k, Vec2 a) { return {a.x * k, a.y * k}; }

inline double dot(Vec2 a, Vec2 b)   { return a.x * b.x + a.y * b.y; }
inline double cross(Vec2 a, Vec2 b) { return a.x * b.y - a.y * b.x; }
inline double norm(Vec2 a)          { return std::sqrt(a.x * a.x + a.y * a.y); }
inline double distance(Vec2 a, Vec2 b) { return norm(b - a); }

// Left-hand perpendicular (counter-clockwise rotation by 90 degrees).
inline Vec2 perp(Vec2 a) { return {-a.y, a.x}; }

inline Vec2 normalized(Vec2 a) {
  const double n = norm(a);
  if (!(n > 0.0) || !std::isfinite(n)) return {0.0, 0.0};
  return {a.x / n, a.y / n};
}

inline Vec2 lerp(Vec2 a, Vec2 b, double t) { return a + (b - a) * t; }

inline bool is_finite(Vec2 a) { return std::isfinite(a.x) && std::isfinite(a.y); }

inline bool nearly_equal(Vec2 a, Vec2 b, double tol = kClosureTol) {
  return std::fabs(a.x - b.x) <= tol && std::fabs(a.y - b.y) <= tol;
}

// Normalize an angle to (-pi, pi].
inline double wrap_angle(double a) {
  if (!std::isfinite(a)) return 0.0;
  double w = std::fmod(a + kPI, kTAU);
  if (w < 0.0) w += kTAU;
  w -= kPI;
  return (w <= -kPI) ? kPI : w;
}

inline bool is_closed(const std::vector<Vec2>& pts, double tol = kClosureTol) {
  return pts.size() >= 2 && nearly_equal(pts.front(), pts.back(), tol);
}

// Repeat the first point at the end when the polyline is open.
inline void close_loop(std::vector<Vec2>& pts, double tol = kClosureTol) {
  if (pts.size() < 2) return;
  if (!is_closed(pts, tol)) pts.push_back(pts.front());
  else pts.back() = pts.front();
}

} // namespace rline

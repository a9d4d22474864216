#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <rline/aero.hpp>
#include <rline/speed_profile.hpp>
#include <rline/track.hpp>
#include <rline/track_geometry.hpp>

using Catch::Approx;
using namespace rline;

static TrackGeometry circle_geom_(double R) {
  return build_track_geometry(circle_centerline(R, 100), 15.0, 100, 16);
}

TEST_CASE("corner speed grows with radius and friction") {
  const AeroModel aero;
  const SpeedSolver solver(aero, SpeedSettings{});
  const VehicleParams car;

  const double tight = solver.corner_speed(1.0 / 40.0, car, 0.85);
  const double wide = solver.corner_speed(1.0 / 200.0, car, 0.85);
  const double grippy = solver.corner_speed(1.0 / 40.0, car, 1.2);
  REQUIRE(tight < wide);
  REQUIRE(tight < grippy);
  // Downforce adds grip above the mechanical limit.
  REQUIRE(tight > std::sqrt(0.85 * kGravity * 40.0));
}

TEST_CASE("corners tighter than the steering lock are capped") {
  const AeroModel aero;
  const SpeedSolver solver(aero, SpeedSettings{});
  const VehicleParams car; // min turn radius ~5.2 m
  REQUIRE(solver.corner_speed(1.0 / 3.0, car, 0.85) == Approx(std::sqrt(0.85 * kGravity * 3.0)));
  REQUIRE(solver.corner_speed(1.0 / 3.0, car, 1.9) <= kSteeringLimitedSpeed);
}

TEST_CASE("straights run at the drag-limited speed") {
  const AeroModel aero;
  const SpeedSolver solver(aero, SpeedSettings{});
  const VehicleParams car;
  REQUIRE(solver.corner_speed(0.0, car, 0.85) == Approx(solver.straight_speed(car)));
  REQUIRE(solver.straight_speed(car) == Approx(aero.drag_limited_speed(3750.0, 4.9, 1.0)));
}

TEST_CASE("closed-form speeds on a circle are near constant") {
  const AeroModel aero;
  const SpeedSolver solver(aero, SpeedSettings{});
  const VehicleParams car;
  const auto geom = circle_geom_(100.0);

  const auto v = solver.closed_form(geom, car, 0.85);
  REQUIRE(v.size() == geom.size());
  REQUIRE(v.front() == v.back());
  const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
  REQUIRE(*hi - *lo < 0.02 * *hi);
  for (double x : v) {
    REQUIRE(x >= 5.0);
    REQUIRE(x <= 100.0);
  }
}

TEST_CASE("speed window clamps every sample") {
  const AeroModel aero;
  SpeedSettings s;
  s.min_speed = 40.0;
  s.max_speed = 45.0;
  const SpeedSolver solver(aero, s);
  const auto v = solver.closed_form(circle_geom_(20.0), VehicleParams{}, 0.85);
  for (double x : v) {
    REQUIRE(x >= 40.0);
    REQUIRE(x <= 45.0);
  }
}

TEST_CASE("forward-backward never exceeds the steady-state limit") {
  const AeroModel aero;
  SpeedSettings s;
  s.method = SpeedMethod::ForwardBackward;
  s.smoothing_sigma = 0.0;
  const SpeedSolver solver(aero, s);
  const VehicleParams car;
  const auto geom = build_track_geometry(stadium_centerline(400.0, 40.0), 14.0, 100, 16);

  const auto steady = solver.steady_state(geom, car, 0.9);
  const auto fb = solver.forward_backward(geom, car, 0.9);
  REQUIRE(fb.size() == geom.size());
  for (std::size_t i = 0; i < fb.size(); ++i) REQUIRE(fb[i] <= steady[i] + 1e-9);

  // Acceleration and braking limits lower the lap average.
  const double mean_fb = std::accumulate(fb.begin(), fb.end(), 0.0) / double(fb.size());
  const double mean_ss = std::accumulate(steady.begin(), steady.end(), 0.0) / double(steady.size());
  REQUIRE(mean_fb < mean_ss);
  REQUIRE(solver.speeds(geom, car, 0.9) == fb);
}

TEST_CASE("lap_time integrates segment length over mean speed") {
  const std::vector<Vec2> square{{0, 0}, {100, 0}, {100, 100}, {0, 100}, {0, 0}};
  const std::vector<double> v(5, 20.0);
  REQUIRE(lap_time(square, v) == Approx(400.0 / 20.0));

  // Coincident points count as a minimum segment
  const std::vector<Vec2> dup{{0, 0}, {0, 0}, {10, 0}};
  REQUIRE(lap_time(dup, {10.0, 10.0, 10.0}) == Approx((0.1 + 10.0) / 10.0));
}

TEST_CASE("invalid speed settings are rejected") {
  const AeroModel aero;
  SpeedSettings s;
  s.min_speed = 50.0;
  s.max_speed = 40.0;
  REQUIRE_THROWS_AS(SpeedSolver(aero, s), std::invalid_argument);
}

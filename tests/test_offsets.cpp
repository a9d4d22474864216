#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <rline/aero.hpp>
#include <rline/curvilinear.hpp>
#include <rline/models.hpp>
#include <rline/offsets.hpp>
#include <rline/track.hpp>
#include <rline/track_geometry.hpp>

using Catch::Approx;
using namespace rline;

// Counter-clockwise rectangle with a point every `step` metres.
static std::vector<Vec2> rectangle_(double w, double h, double step) {
  std::vector<Vec2> pts;
  const Vec2 corners[4] = {{0, 0}, {w, 0}, {w, h}, {0, h}};
  for (int c = 0; c < 4; ++c) {
    const Vec2 a = corners[c];
    const Vec2 b = corners[(c + 1) % 4];
    const int n = static_cast<int>(std::round(distance(a, b) / step));
    for (int k = 0; k < n; ++k) pts.push_back(lerp(a, b, double(k) / n));
  }
  return pts;
}

static std::size_t nearest_index_(const TrackGeometry& g, double s) {
  std::size_t best = 0;
  for (std::size_t i = 0; i + 1 < g.size(); ++i) {
    if (std::fabs(g.s[i] - s) < std::fabs(g.s[best] - s)) best = i;
  }
  return best;
}

TEST_CASE("phase classification on a synthetic curvature bump") {
  OffsetSettings s;
  s.phase_window = 3;
  const OffsetSolver solver(s);

  std::vector<double> k(30, 0.0);
  k[10] = 0.01; k[11] = 0.03; k[12] = 0.05; k[13] = 0.03; k[14] = 0.01;
  k.back() = k.front();
  const auto phases = solver.classify(k);

  REQUIRE(phases.size() == k.size());
  REQUIRE(phases[0] == CornerPhase::Straight);
  REQUIRE(phases[12] == CornerPhase::Apex);
  REQUIRE(phases[10] == CornerPhase::Entry);
  REQUIRE(phases[14] == CornerPhase::Exit);
}

TEST_CASE("constant curvature classifies as sustained") {
  const OffsetSolver solver(OffsetSettings{});
  std::vector<double> k(41, 0.01);
  const auto phases = solver.classify(k);
  for (auto p : phases) REQUIRE(p == CornerPhase::Sustained);
}

TEST_CASE("speed tiers pick the first matching factor") {
  const OffsetSolver solver(OffsetSettings{});
  REQUIRE(solver.speed_factor(20.0) == Approx(1.0));
  REQUIRE(solver.speed_factor(40.0) == Approx(0.8));
  REQUIRE(solver.speed_factor(70.0) == Approx(0.6));
  REQUIRE(solver.max_offset(15.0) == Approx(6.0));
}

TEST_CASE("circle offsets stay near zero") {
  const AeroModel aero;
  const ModelRegistry registry;
  const RacingModel model(registry.get(ModelId::PhysicsBased), aero);
  const auto geom = build_track_geometry(circle_centerline(100.0, 100), 15.0, 100, 16);

  const auto v = model.speeds(geom, VehicleParams{}, 0.85);
  const auto n = model.offset_solver().offsets(geom, v, 15.0);
  REQUIRE(n.size() == geom.size());
  for (double x : n) REQUIRE(std::fabs(x) < 0.1 * 6.0);
}

TEST_CASE("sharp corner gets a larger inside offset than the straight") {
  const AeroModel aero;
  const ModelRegistry registry;
  const RacingModel model(registry.get(ModelId::PhysicsBased), aero);
  const double width = 12.0;
  const auto geom = build_track_geometry(rectangle_(1000.0, 200.0, 10.0), width, 100, 16);
  const CurvilinearFrame frame(geom);

  const auto v = model.speeds(geom, VehicleParams{}, 0.9);
  const auto n = model.offset_solver().offsets(geom, v, width);
  const std::size_t unique = geom.size() - 1;

  // Corner at (1000, 0), middle of the preceding straight at (500, 0).
  const std::size_t corner = nearest_index_(geom, frame.to_curvilinear({1000.0, 0.0}).s);
  const std::size_t mid = nearest_index_(geom, frame.to_curvilinear({500.0, 0.0}).s);

  double apex = -1e9;
  for (std::size_t d = 0; d <= 4; ++d) apex = std::max(apex, n[(corner + unique + d - 2) % unique]);
  REQUIRE(apex > 1.0);                          // toward the inside of a left turn
  REQUIRE(apex > std::fabs(n[mid]) + 1.0);
  for (double x : n) REQUIRE(std::fabs(x) <= model.offset_solver().max_offset(width) + 1e-9);

  // Speed has a local minimum on the corner.
  REQUIRE(v[corner] < v[mid] - 1.0);
  std::size_t slowest = corner;
  for (std::size_t d = 0; d <= 20; ++d) {
    const std::size_t i = (corner + unique + d - 10) % unique;
    if (v[i] < v[slowest]) slowest = i;
  }
  const auto gap = static_cast<long>(slowest) - static_cast<long>(corner);
  REQUIRE(std::labs(gap) <= 2);
}

TEST_CASE("apply maps offsets through the frame and closes the loop") {
  const auto geom = build_track_geometry(circle_centerline(100.0, 100), 15.0, 100, 16);
  const CurvilinearFrame frame(geom);
  const std::vector<double> n(geom.size(), 2.0);
  const auto line = OffsetSolver::apply(frame, n);
  REQUIRE(line.size() == geom.size());
  REQUIRE(nearly_equal(line.front(), line.back()));
  REQUIRE(norm(line[10]) == Approx(98.0).margin(0.05));
}

TEST_CASE("apply_boundary rescales along the offset direction") {
  const std::vector<Vec2> center{{0, 0}, {10, 0}};
  std::vector<Vec2> line{{3, 4}, {10, 1}};
  apply_boundary(line, center, 2.5);
  REQUIRE(line[0].x == Approx(1.5));
  REQUIRE(line[0].y == Approx(2.0));
  REQUIRE(line[1].y == Approx(1.0));
}

TEST_CASE("reduce_curvature keeps the line inside the allowed band") {
  const auto geom = build_track_geometry(stadium_centerline(300.0, 30.0), 14.0, 100, 16);
  const std::vector<double> v(geom.size(), 30.0);
  const double max_off = 0.425 * 14.0;
  const auto out = reduce_curvature(geom.points, geom.points, v, max_off, RefinementSettings{});

  REQUIRE(out.size() == geom.size());
  REQUIRE(nearly_equal(out.front(), out.back()));
  for (std::size_t i = 0; i < out.size(); ++i) {
    REQUIRE(distance(out[i], geom.points[i]) <= max_off + 1e-9);
  }
  // Something moved
  double moved = 0.0;
  for (std::size_t i = 0; i < out.size(); ++i) moved = std::max(moved, distance(out[i], geom.points[i]));
  REQUIRE(moved > 0.05);
}

TEST_CASE("refine_line never returns a slower lap than its start") {
  const AeroModel aero;
  const ModelRegistry registry;
  const auto& spec = registry.get(ModelId::Kapania);
  const RacingModel model(spec, aero);
  const VehicleParams car;
  const auto geom = build_track_geometry(stadium_centerline(300.0, 30.0), 14.0, 100, 16);

  const auto start_speeds = model.speed_solver().forward_backward(geom, car, 0.9);
  const double start_lap = lap_time(geom.points, start_speeds);

  const auto refined = refine_line(geom.points, geom.points, 7.0, 0.425 * 14.0, model.speed_solver(), car,
                                   0.9, spec.refinement);
  REQUIRE(refined.iterations >= 1);
  REQUIRE(refined.iterations <= spec.refinement.max_iterations);
  REQUIRE(refined.line.size() == geom.size());
  REQUIRE(refined.lap_time <= start_lap + 1e-9);
}

TEST_CASE("offset settings are validated") {
  OffsetSettings s;
  s.usage_fraction = 0.6;
  REQUIRE_THROWS_AS(OffsetSolver(s), std::invalid_argument);
}

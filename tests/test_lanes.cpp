#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <rline/curvilinear.hpp>
#include <rline/lanes.hpp>
#include <rline/track.hpp>
#include <rline/track_geometry.hpp>

using Catch::Approx;
using namespace rline;

TEST_CASE("lane separation is bounded by the track width") {
  const LaneSettings s;
  REQUIRE(lane_separation(20.0, s) == Approx(3.0));
  REQUIRE(lane_separation(10.0, s) == Approx(2.0));
}

TEST_CASE("lane schedule is symmetric and sorted") {
  const LaneSettings s;
  const auto two = lane_schedule(2, 15.0, s);
  REQUIRE(two.size() == 2);
  REQUIRE(two[0] == Approx(-0.5 * 3.3));
  REQUIRE(two[1] == Approx(0.5 * 3.3));

  const auto three = lane_schedule(3, 15.0, s);
  REQUIRE(three[1] == Approx(0.0).margin(1e-12));
  REQUIRE(std::is_sorted(three.begin(), three.end()));
}

TEST_CASE("lane schedule clamps the vehicle count") {
  const LaneSettings s;
  REQUIRE(lane_schedule(0, 15.0, s).size() == 1);
  REQUIRE(lane_schedule(10, 15.0, s).size() == 6);
}

TEST_CASE("lane schedule squeezes onto narrow tracks") {
  LaneSettings s;
  s.min_separation = 5.0;
  s.width_fraction = 1.0;
  const auto lanes = lane_schedule(6, 6.0, s);
  REQUIRE(lanes.back() - lanes.front() <= 2.0 * 6.0 * s.boundary_fraction + 1e-9);
}

TEST_CASE("one vehicle keeps the base line") {
  const CurvilinearFrame frame(build_track_geometry(circle_centerline(100.0, 100), 15.0, 100, 16));
  const auto& base = frame.geometry().points;
  const auto lanes = separate_lanes(frame, base, 15.0, 1, LaneSettings{});
  REQUIRE(lanes.size() == 1);
  REQUIRE(lanes[0].size() == base.size());
}

TEST_CASE("three lanes never come closer than the minimum separation") {
  const double width = 20.0;
  const CurvilinearFrame frame(build_track_geometry(stadium_centerline(300.0, 60.0), width, 100, 16));
  const LaneSettings s;
  const auto lanes = separate_lanes(frame, frame.geometry().points, width, 3, s);
  REQUIRE(lanes.size() == 3);

  const double sep = lane_separation(width, s);
  for (std::size_t a = 0; a < lanes.size(); ++a) {
    REQUIRE(nearly_equal(lanes[a].front(), lanes[a].back()));
    for (std::size_t b = a + 1; b < lanes.size(); ++b) {
      for (std::size_t i = 0; i < lanes[a].size(); ++i) {
        REQUIRE(distance(lanes[a][i], lanes[b][i]) >= sep - 1e-9);
      }
    }
  }
  // Every lane stays on the track
  const auto& g = frame.geometry();
  for (const auto& lane : lanes) {
    for (std::size_t i = 0; i < lane.size(); ++i) {
      REQUIRE(distance(lane[i], g.points[i]) <= width * s.boundary_fraction + 1e-6);
    }
  }
}

TEST_CASE("separate_lanes rejects a mismatched base line") {
  const CurvilinearFrame frame(build_track_geometry(circle_centerline(50.0, 40), 15.0, 40, 16));
  const std::vector<Vec2> wrong{{0, 0}, {1, 0}, {0, 1}, {0, 0}};
  REQUIRE_THROWS_AS(separate_lanes(frame, wrong, 15.0, 2, LaneSettings{}), std::invalid_argument);
}

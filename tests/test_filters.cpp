#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include <rline/filters.hpp>

using Catch::Approx;
using namespace rline;

TEST_CASE("gaussian_filter keeps constant sequences constant") {
  const std::vector<double> v(20, 3.5);
  for (auto mode : {EdgeMode::Reflect, EdgeMode::Wrap}) {
    const auto out = gaussian_filter(v, 2.0, mode);
    REQUIRE(out.size() == v.size());
    for (double x : out) REQUIRE(x == Approx(3.5));
  }
}

TEST_CASE("gaussian_filter with sigma <= 0 is the identity") {
  const std::vector<double> v{1.0, 5.0, -2.0, 4.0};
  REQUIRE(gaussian_filter(v, 0.0) == v);
  REQUIRE(gaussian_filter(v, -1.0) == v);
}

TEST_CASE("wrapped filter treats the sequence as periodic") {
  // An impulse at index 0 spreads to the far end only when wrapping.
  std::vector<double> v(16, 0.0);
  v[0] = 1.0;
  const auto wrap = gaussian_filter(v, 1.0, EdgeMode::Wrap);
  const auto refl = gaussian_filter(v, 1.0, EdgeMode::Reflect);
  REQUIRE(wrap.back() == Approx(wrap[1]));
  REQUIRE(refl.back() == Approx(0.0).margin(1e-9));

  double sum = 0.0;
  for (double x : wrap) sum += x;
  REQUIRE(sum == Approx(1.0));
}

TEST_CASE("smooth_closed restores closure") {
  std::vector<double> closed{0.0, 1.0, 4.0, 1.0, 0.0, -2.0, 0.0};
  const auto out = smooth_closed(closed, std::vector<double>{0.8, 1.2});
  REQUIRE(out.size() == closed.size());
  REQUIRE(out.front() == out.back());
  // Peak is flattened
  REQUIRE(out[2] < 4.0);
}

TEST_CASE("moving_average_closed averages neighbours across the seam") {
  const std::vector<Vec2> sq{{0, 0}, {3, 0}, {3, 3}, {0, 3}, {0, 0}};
  const auto out = moving_average_closed(sq);
  REQUIRE(out.size() == sq.size());
  REQUIRE(out[0].x == Approx(1.0));
  REQUIRE(out[0].y == Approx(1.0));
  REQUIRE(nearly_equal(out.front(), out.back()));
}

TEST_CASE("sanitize replaces non-finite values") {
  std::vector<double> v{1.0, std::numeric_limits<double>::quiet_NaN(),
                        std::numeric_limits<double>::infinity(), 2.0};
  sanitize(v, 7.0);
  REQUIRE(v == std::vector<double>{1.0, 7.0, 7.0, 2.0});
}

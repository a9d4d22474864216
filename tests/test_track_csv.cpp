#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <rline/track.hpp>

using Catch::Approx;
using namespace rline;

static std::string csv_minimal = R"(x,y
0,0
100,0
100,50
)";

static std::string csv_with_noise = R"( x , y
# comment lines are ignored
0 , 0
, ,
10, abc
100 , 0

50.5, 25.25, extra
)";

TEST_CASE("centerline_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto pts = centerline_from_csv_stream(ss);
  REQUIRE(pts.size() == 3);
  REQUIRE(pts[1].x == Approx(100.0));
  REQUIRE(pts[2].y == Approx(50.0));
}

TEST_CASE("centerline_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto pts = centerline_from_csv_stream(ss);
  REQUIRE(pts.size() == 3);
  REQUIRE(pts[2].x == Approx(50.5));
  REQUIRE(pts[2].y == Approx(25.25));
}

TEST_CASE("headerless CSV keeps its first row") {
  std::istringstream ss("1,2\n3,4\n5,6\n");
  REQUIRE(centerline_from_csv_stream(ss).size() == 3);
}

TEST_CASE("load_centerline_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_centerline_csv("this/file/does/not/exist.csv").has_value());
}

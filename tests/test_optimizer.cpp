#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <rline/aero.hpp>
#include <rline/lanes.hpp>
#include <rline/log.hpp>
#include <rline/models.hpp>
#include <rline/optimizer.hpp>
#include <rline/track.hpp>

using Catch::Approx;
using namespace rline;

static VehicleParams car_(const std::string& id) {
  VehicleParams v;
  v.id = id;
  v.mass = 750.0;
  v.drag_coefficient = 1.0;
  v.lift_coefficient = 3.0;
  return v;
}

static OptimizeRequest circle_request_() {
  OptimizeRequest req;
  req.track_points = circle_centerline(100.0, 100);
  req.track_width = 15.0;
  req.friction = 0.85;
  req.model_id = "physics_based";
  req.vehicles = {car_("car1")};
  return req;
}

// Fails every vehicle whose id starts with "bad".
class FailingOptimizer : public RacingLineOptimizer {
public:
  using RacingLineOptimizer::RacingLineOptimizer;

protected:
  VehicleResult solve_vehicle_(const RacingModel& model, const std::vector<Vec2>& line,
                               const VehicleParams& vehicle, const OptimizeRequest& request) const override {
    if (vehicle.id.rfind("bad", 0) == 0) throw std::runtime_error("forced failure");
    return RacingLineOptimizer::solve_vehicle_(model, line, vehicle, request);
  }
};

class BrokenLineOptimizer : public RacingLineOptimizer {
public:
  using RacingLineOptimizer::RacingLineOptimizer;

protected:
  std::vector<Vec2> solve_base_line_(const RacingModel&, const CurvilinearFrame&,
                                     const OptimizeRequest&) const override {
    throw std::runtime_error("no line");
  }
};

// Throws something that is not a std::exception.
class OddFailureOptimizer : public RacingLineOptimizer {
public:
  using RacingLineOptimizer::RacingLineOptimizer;

protected:
  VehicleResult solve_vehicle_(const RacingModel&, const std::vector<Vec2>&,
                               const VehicleParams&, const OptimizeRequest&) const override {
    throw 42;
  }
};

TEST_CASE("circle scenario: constant speed, centred line, lap = 2piR / v") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);

  const auto results = opt.optimize(circle_request_());
  REQUIRE(results.size() == 1);
  const auto& r = results[0];
  REQUIRE(r.vehicle_id == "car1");
  REQUIRE(r.model_id == "physics_based");
  REQUIRE_FALSE(r.fallback);
  REQUIRE(r.coordinates.size() == 101);
  REQUIRE(r.speeds.size() == r.coordinates.size());
  REQUIRE(nearly_equal(r.coordinates.front(), r.coordinates.back()));

  const auto [lo, hi] = std::minmax_element(r.speeds.begin(), r.speeds.end());
  const double avg = std::accumulate(r.speeds.begin(), r.speeds.end(), 0.0) / double(r.speeds.size());
  REQUIRE(*hi - *lo < 0.02 * avg);
  for (const auto& p : r.coordinates) REQUIRE(norm(p) == Approx(100.0).margin(0.6));
  REQUIRE(r.lap_time == Approx(kTAU * 100.0 / avg).epsilon(0.02));
}

TEST_CASE("two vehicles get distinct non-crossing lines near the minimum separation") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);

  auto req = circle_request_();
  req.track_points = stadium_centerline(250.0, 80.0);
  req.vehicles = {car_("a"), car_("b")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 2);
  REQUIRE(results[0].vehicle_id == "a");
  REQUIRE(results[1].vehicle_id == "b");

  const auto& l0 = results[0].coordinates;
  const auto& l1 = results[1].coordinates;
  REQUIRE(l0.size() == l1.size());

  const double sep = lane_separation(req.track_width, opt.config().lanes);
  double total = 0.0;
  for (std::size_t i = 0; i < l0.size(); ++i) {
    const double d = distance(l0[i], l1[i]);
    REQUIRE(d >= sep - 1e-9);
    total += d;
  }
  const double mean = total / double(l0.size());
  REQUIRE(mean >= sep);
  REQUIRE(mean <= 1.2 * sep);
  for (const auto& r : results) REQUIRE(r.lap_time > 0.0);
}

TEST_CASE("vehicles beyond the lane limit share the base line") {
  const ModelRegistry registry;
  const AeroModel aero;
  OptimizerConfig cfg;
  cfg.lanes.max_vehicles = 2;
  const RacingLineOptimizer opt(registry, aero, cfg);

  auto req = circle_request_();
  req.vehicles = {car_("a"), car_("b"), car_("c")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 3);
  REQUIRE(results[2].coordinates.size() == results[0].coordinates.size());
  REQUIRE_FALSE(results[2].fallback);
}

TEST_CASE("a failing vehicle falls back to the centerline without affecting others") {
  const ModelRegistry registry;
  const AeroModel aero;
  std::ostringstream out;
  StreamLogger log(out, LogLevel::Info);
  const FailingOptimizer opt(registry, aero, OptimizerConfig{}, log);

  auto req = circle_request_();
  req.vehicles = {car_("good"), car_("bad1")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 2);
  REQUIRE_FALSE(results[0].fallback);
  REQUIRE(results[1].fallback);
  for (double v : results[1].speeds) REQUIRE(v == Approx(10.0));
  REQUIRE(results[1].lap_time > 0.0);
  REQUIRE(out.str().find("forced failure") != std::string::npos);
}

TEST_CASE("fallback speed stays inside the model's speed window") {
  const ModelRegistry registry;
  const AeroModel aero;
  const FailingOptimizer opt(registry, aero);

  auto req = circle_request_();
  req.model_id = "kapania";
  req.vehicles = {car_("bad1")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].fallback);
  for (double v : results[0].speeds) REQUIRE(v >= 15.0);
  REQUIRE(results[0].lap_time == Approx(kTAU * 100.0 / 15.0).epsilon(0.01));
}

TEST_CASE("non-standard exceptions from a worker still fall back") {
  const ModelRegistry registry;
  const AeroModel aero;
  std::ostringstream out;
  StreamLogger log(out, LogLevel::Error);
  OptimizerConfig cfg;
  cfg.worker_threads = 2;
  const OddFailureOptimizer opt(registry, aero, cfg, log);

  auto req = circle_request_();
  req.track_width = 30.0;
  req.vehicles = {car_("a"), car_("b")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 2);
  for (const auto& r : results) REQUIRE(r.fallback);
  REQUIRE(out.str().find("unknown error") != std::string::npos);
}

TEST_CASE("a failing racing line falls back for every vehicle") {
  const ModelRegistry registry;
  const AeroModel aero;
  const BrokenLineOptimizer opt(registry, aero);

  auto req = circle_request_();
  req.vehicles = {car_("a"), car_("b")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == 2);
  for (const auto& r : results) {
    REQUIRE(r.fallback);
    REQUIRE(r.lap_time == Approx(kTAU * 100.0 / 10.0).epsilon(0.01));
  }
}

TEST_CASE("worker threads keep request order") {
  const ModelRegistry registry;
  const AeroModel aero;
  OptimizerConfig cfg;
  cfg.worker_threads = 4;
  const FailingOptimizer opt(registry, aero, cfg);

  auto req = circle_request_();
  req.track_width = 30.0;
  req.vehicles = {car_("v0"), car_("bad1"), car_("v2"), car_("v3"), car_("bad4")};
  const auto results = opt.optimize(req);
  REQUIRE(results.size() == req.vehicles.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    REQUIRE(results[i].vehicle_id == req.vehicles[i].id);
    REQUIRE(results[i].fallback == (req.vehicles[i].id.rfind("bad", 0) == 0));
  }
}

TEST_CASE("unknown model ids use the default model") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);
  auto req = circle_request_();
  req.model_id = "mystery";
  REQUIRE(opt.optimize(req).at(0).model_id == "physics_based");
}

TEST_CASE("client errors are rejected before any work") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);

  auto few = circle_request_();
  few.track_points = {{0, 0}, {1, 0}};
  REQUIRE_THROWS_AS(opt.optimize(few), std::invalid_argument);

  auto width = circle_request_();
  width.track_width = -1.0;
  REQUIRE_THROWS_AS(opt.optimize(width), std::invalid_argument);

  auto mu = circle_request_();
  mu.friction = 2.5;
  REQUIRE_THROWS_AS(opt.optimize(mu), std::invalid_argument);

  auto car = circle_request_();
  car.vehicles[0].mass = -5.0;
  REQUIRE_THROWS_AS(opt.optimize(car), std::invalid_argument);
}

TEST_CASE("no vehicles yields no results") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);
  auto req = circle_request_();
  req.vehicles.clear();
  REQUIRE(opt.optimize(req).empty());
}

TEST_CASE("list_models exposes the registry") {
  const ModelRegistry registry;
  const AeroModel aero;
  const RacingLineOptimizer opt(registry, aero);
  REQUIRE(opt.list_models().size() == 3);
}

#include <rline/optimizer.hpp>
#include <rline/track_geometry.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <utility>

namespace rline {

void OptimizerConfig::validate() const {
  if (resample_points < 3) throw std::invalid_argument("optimizer.resample_points must be at least 3");
  if (min_resample_points < 3) throw std::invalid_argument("optimizer.min_resample_points must be at least 3");
  if (worker_threads < 1) throw std::invalid_argument("optimizer.worker_threads must be at least 1");
  if (!(fallback_speed > 0.0)) throw std::invalid_argument("optimizer.fallback_speed must be positive");
  lanes.validate();
}

void OptimizeRequest::validate() const {
  if (track_points.size() < 3) throw std::invalid_argument("track must contain at least 3 points");
  if (!(track_width > 0.0) || !std::isfinite(track_width)) {
    throw std::invalid_argument("track width must be positive");
  }
  if (!(friction > 0.0 && friction < 2.0)) {
    throw std::invalid_argument("friction must be in (0, 2)");
  }
  for (const auto& v : vehicles) v.validate();
}

RacingLineOptimizer::RacingLineOptimizer(const ModelRegistry& registry, const AeroModel& aero,
                                         OptimizerConfig config, Logger& log)
  : registry_(registry), aero_(aero), config_(std::move(config)), log_(log) {
  config_.validate();
}

std::vector<Vec2> RacingLineOptimizer::solve_base_line_(const RacingModel& model, const CurvilinearFrame& frame,
                                                        const OptimizeRequest& request) const {
  return model.racing_line(frame, request.vehicles.front(), request.friction, request.track_width, log_);
}

VehicleResult RacingLineOptimizer::solve_vehicle_(const RacingModel& model, const std::vector<Vec2>& line,
                                                  const VehicleParams& vehicle,
                                                  const OptimizeRequest& request) const {
  const auto geom = geometry_from_closed(line, 0.5 * request.track_width);

  VehicleResult r;
  r.vehicle_id = vehicle.id;
  r.model_id = model_key(model.spec().id);
  r.coordinates = line;
  r.speeds = model.speeds(geom, vehicle, request.friction);
  r.lap_time = lap_time(line, r.speeds);
  return r;
}

VehicleResult RacingLineOptimizer::fallback_(const CurvilinearFrame& frame, const VehicleParams& vehicle,
                                             const ModelSpec& spec) const {
  VehicleResult r;
  r.vehicle_id = vehicle.id;
  r.model_id = model_key(spec.id);
  r.coordinates = frame.geometry().points;
  // Constant speed inside the model's window.
  const double v = std::clamp(config_.fallback_speed, spec.speed.min_speed, spec.speed.max_speed);
  r.speeds.assign(r.coordinates.size(), v);
  r.lap_time = frame.length() / v;
  r.fallback = true;
  return r;
}

void RacingLineOptimizer::sanitize_(VehicleResult& r, double speed_floor) const {
  for (auto& p : r.coordinates) {
    if (!std::isfinite(p.x)) p.x = 0.0;
    if (!std::isfinite(p.y)) p.y = 0.0;
  }
  for (auto& v : r.speeds) {
    if (!std::isfinite(v) || !(v > 0.0)) v = speed_floor;
  }
  if (!std::isfinite(r.lap_time)) r.lap_time = 0.0;
}

VehicleResult RacingLineOptimizer::run_vehicle_(const RacingModel& model, const CurvilinearFrame& frame,
                                                const std::vector<Vec2>* line, const VehicleParams& vehicle,
                                                const OptimizeRequest& request) const {
  const auto& spec = model.spec();
  VehicleResult r;
  if (line == nullptr) {
    r = fallback_(frame, vehicle, spec);
  } else {
    try {
      r = solve_vehicle_(model, *line, vehicle, request);
    } catch (const std::exception& e) {
      log_.error("vehicle ", vehicle.id, ": optimization failed (", e.what(), "); using centerline");
      r = fallback_(frame, vehicle, spec);
    } catch (...) {
      log_.error("vehicle ", vehicle.id, ": optimization failed (unknown error); using centerline");
      r = fallback_(frame, vehicle, spec);
    }
  }
  sanitize_(r, spec.speed.min_speed);

  if (!r.speeds.empty()) {
    const auto [lo, hi] = std::minmax_element(r.speeds.begin(), r.speeds.end());
    const double avg = std::accumulate(r.speeds.begin(), r.speeds.end(), 0.0) / double(r.speeds.size());
    log_.info("vehicle ", r.vehicle_id, " [", r.model_id, "]: lap ", r.lap_time, " s, speed avg ", avg,
              " min ", *lo, " max ", *hi, " m/s", r.fallback ? " (fallback)" : "");
  }
  return r;
}

std::vector<VehicleResult> RacingLineOptimizer::optimize(const OptimizeRequest& request) const {
  request.validate();

  const ModelSpec& spec = registry_.resolve(request.model_id, log_);
  const RacingModel model(spec, aero_);

  CurvilinearFrame frame(build_track_geometry(request.track_points, request.track_width,
                                              config_.resample_points, config_.min_resample_points, log_));

  const std::size_t count = request.vehicles.size();
  std::vector<VehicleResult> results(count);
  if (count == 0) return results;

  std::vector<Vec2> base;
  std::vector<std::vector<Vec2>> lanes;
  try {
    base = solve_base_line_(model, frame, request);
    lanes = separate_lanes(frame, base, request.track_width, count, config_.lanes);
  } catch (const std::exception& e) {
    log_.error("racing line failed (", e.what(), "); every vehicle uses the centerline");
    base.clear();
    lanes.clear();
  }

  auto line_for = [&](std::size_t i) -> const std::vector<Vec2>* {
    if (i < lanes.size()) return &lanes[i];
    return base.empty() ? nullptr : &base;
  };

  const std::size_t threads = std::min<std::size_t>(static_cast<std::size_t>(config_.worker_threads), count);
  if (threads <= 1) {
    for (std::size_t i = 0; i < count; ++i) {
      results[i] = run_vehicle_(model, frame, line_for(i), request.vehicles[i], request);
    }
    return results;
  }

  // Each slot is written by exactly one worker.
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      results[i] = run_vehicle_(model, frame, line_for(i), request.vehicles[i], request);
    }
  };
  std::vector<std::thread> pool;
  pool.reserve(threads);
  for (std::size_t k = 0; k < threads; ++k) pool.emplace_back(worker);
  for (auto& t : pool) t.join();
  return results;
}

} // namespace rline

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <rline/aero.hpp>
#include <rline/lanes.hpp>
#include <rline/log.hpp>
#include <rline/models.hpp>
#include <rline/vehicle.hpp>

namespace rline {

struct OptimizerConfig {
  std::size_t resample_points = 100;   // unique samples of the processed centerline
  std::size_t min_resample_points = 16;
  int worker_threads = 1;              // > 1 solves vehicles on a bounded pool
  double fallback_speed = 10.0;        // m/s used when a vehicle fails
  LaneSettings lanes;

  void validate() const;
};

struct OptimizeRequest {
  std::vector<Vec2> track_points;
  double track_width{};
  double friction{};
  std::vector<VehicleParams> vehicles;
  std::string model_id;

  // Throws std::invalid_argument on client errors.
  void validate() const;
};

struct VehicleResult {
  std::string vehicle_id;
  std::vector<Vec2> coordinates;  // closed
  std::vector<double> speeds;     // one per coordinate
  double lap_time{};
  std::string model_id;
  bool fallback{false};           // centerline substituted after a failure
};

// Request entry point. Builds the track once, computes the shared racing line
// with the first vehicle, separates lanes and evaluates every vehicle.
class RacingLineOptimizer {
public:
  RacingLineOptimizer(const ModelRegistry& registry, const AeroModel& aero,
                      OptimizerConfig config = {}, Logger& log = null_logger());
  virtual ~RacingLineOptimizer() = default;

  RacingLineOptimizer(const RacingLineOptimizer&) = delete;
  RacingLineOptimizer& operator=(const RacingLineOptimizer&) = delete;

  // One result per vehicle, in request order.
  std::vector<VehicleResult> optimize(const OptimizeRequest& request) const;

  std::vector<ModelInfo> list_models() const { return registry_.list(); }

  const OptimizerConfig& config() const { return config_; }

protected:
  // Shared racing line of the request, computed with the first vehicle.
  virtual std::vector<Vec2> solve_base_line_(const RacingModel& model, const CurvilinearFrame& frame,
                                             const OptimizeRequest& request) const;

  // Speeds and lap time of one vehicle on its own line.
  virtual VehicleResult solve_vehicle_(const RacingModel& model, const std::vector<Vec2>& line,
                                       const VehicleParams& vehicle, const OptimizeRequest& request) const;

private:
  VehicleResult run_vehicle_(const RacingModel& model, const CurvilinearFrame& frame,
                             const std::vector<Vec2>* line, const VehicleParams& vehicle,
                             const OptimizeRequest& request) const;
  VehicleResult fallback_(const CurvilinearFrame& frame, const VehicleParams& vehicle,
                          const ModelSpec& spec) const;
  void sanitize_(VehicleResult& r, double speed_floor) const;

  const ModelRegistry& registry_;
  const AeroModel& aero_;
  OptimizerConfig config_;
  Logger& log_;
};

} // namespace rline

#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <rline/aero.hpp>
#include <rline/curvilinear.hpp>
#include <rline/log.hpp>
#include <rline/offsets.hpp>
#include <rline/speed_profile.hpp>
#include <rline/vehicle.hpp>

namespace rline {

enum class ModelId : int {
  PhysicsBased = 0,
  Basic = 1,
  Kapania = 2,
  Count
};

inline constexpr ModelId kDefaultModel = ModelId::PhysicsBased;

// Stable key used on the request boundary ("physics_based", "basic", "kapania").
const char* model_key(ModelId id);
std::optional<ModelId> parse_model_id(std::string_view key);

struct ModelInfo {
  std::string id;
  std::string name;
  std::string description;
  double track_usage_fraction{};
  std::vector<std::string> characteristics;
};

// Everything that distinguishes one racing-line model from another.
struct ModelSpec {
  ModelId id{kDefaultModel};
  std::string name;
  std::string description;
  std::vector<std::string> characteristics;
  SpeedSettings speed;
  OffsetSettings offsets;
  RefinementSettings refinement;

  ModelInfo info() const;
  void validate() const;
};

ModelSpec physics_based_spec();
ModelSpec basic_spec();
ModelSpec kapania_spec();

// Explicit registry of the built-in models, created once and passed by
// reference. Specs may be tuned (e.g. from config) before use.
class ModelRegistry {
public:
  ModelRegistry();

  const ModelSpec& get(ModelId id) const;
  ModelSpec& get(ModelId id);

  std::optional<ModelId> find(std::string_view key) const { return parse_model_id(key); }

  // Unknown keys resolve to kDefaultModel with a warning.
  const ModelSpec& resolve(std::string_view key, Logger& log = null_logger()) const;

  std::vector<ModelInfo> list() const;

  void validate() const;

private:
  std::array<ModelSpec, static_cast<std::size_t>(ModelId::Count)> specs_;
};

// Speeds and racing line of one model for one vehicle.
class RacingModel {
public:
  RacingModel(const ModelSpec& spec, const AeroModel& aero);

  const ModelSpec& spec() const { return spec_; }
  const SpeedSolver& speed_solver() const { return speed_; }
  const OffsetSolver& offset_solver() const { return offsets_; }

  std::vector<double> speeds(const TrackGeometry& geom, const VehicleParams& vehicle, double friction) const;

  // Closed racing line indexed like frame.geometry().
  std::vector<Vec2> racing_line(const CurvilinearFrame& frame, const VehicleParams& vehicle,
                                double friction, double track_width, Logger& log = null_logger()) const;

private:
  const ModelSpec& spec_;
  SpeedSolver speed_;
  OffsetSolver offsets_;
};

} // namespace rline

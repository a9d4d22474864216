#include <rline/models.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace rline {

const char* model_key(ModelId id) {
  switch (id) {
    case ModelId::PhysicsBased: return "physics_based";
    case ModelId::Basic:        return "basic";
    case ModelId::Kapania:      return "kapania";
    default:                    return "unknown";
  }
}

std::optional<ModelId> parse_model_id(std::string_view key) {
  for (int i = 0; i < static_cast<int>(ModelId::Count); ++i) {
    const auto id = static_cast<ModelId>(i);
    if (key == model_key(id)) return id;
  }
  return std::nullopt;
}

ModelInfo ModelSpec::info() const {
  return ModelInfo{model_key(id), name, description, offsets.usage_fraction, characteristics};
}

void ModelSpec::validate() const {
  if (name.empty()) throw std::invalid_argument(std::string("model ") + model_key(id) + " needs a name");
  speed.validate();
  offsets.validate();
  refinement.validate();
}

ModelSpec physics_based_spec() {
  ModelSpec m;
  m.id = ModelId::PhysicsBased;
  m.name = "Physics-Based Model";
  m.description = "Grip and downforce limited speeds with a late-apex line";
  m.characteristics = {"Research-based", "Clean", "Physics-accurate"};
  // Defaults of SpeedSettings / OffsetSettings are this model's tuning.
  return m;
}

ModelSpec basic_spec() {
  ModelSpec m;
  m.id = ModelId::Basic;
  m.name = "Basic Model";
  m.description = "Simple geometric approach";
  m.characteristics = {"Simple", "Smooth", "Learning-friendly"};

  auto& o = m.offsets;
  o.usage_fraction = 0.30;
  o.corner_threshold = 0.005;
  o.curvature_sigma = 5.0;
  o.phase_window = 12;
  o.look_ahead = 12;
  o.apex_weight = 0.6;
  o.entry_weight = -0.35;
  o.exit_weight = -0.3;
  o.setup_weight = 0.5;
  o.severity_gain = 200.0;
  o.speed_tiers.clear();
  o.default_speed_factor = 1.0;
  o.smoothing_sigmas = {1.0, 1.5, 2.0, 2.5};
  o.refit_stride = 3;
  return m;
}

ModelSpec kapania_spec() {
  ModelSpec m;
  m.id = ModelId::Kapania;
  m.name = "Two Step Algorithm";
  m.description = "Iterative forward-backward speed profile with curvature reduction";
  m.characteristics = {"Research-grade", "Iterative", "Curvature minimization"};

  m.speed.method = SpeedMethod::ForwardBackward;
  m.speed.min_speed = 15.0;
  m.speed.max_speed = 90.0;
  m.speed.smoothing_sigma = 0.8;

  auto& o = m.offsets;
  o.usage_fraction = 0.425;
  o.corner_threshold = 0.004;
  o.curvature_sigma = 1.0;
  o.smoothing_sigmas = {0.5, 1.0};
  o.refit_stride = 0;

  m.refinement.enabled = true;
  return m;
}

ModelRegistry::ModelRegistry()
  : specs_{physics_based_spec(), basic_spec(), kapania_spec()} {}

const ModelSpec& ModelRegistry::get(ModelId id) const {
  const auto i = static_cast<std::size_t>(id);
  if (i >= specs_.size()) throw std::out_of_range("unknown model id");
  return specs_[i];
}

ModelSpec& ModelRegistry::get(ModelId id) {
  const auto i = static_cast<std::size_t>(id);
  if (i >= specs_.size()) throw std::out_of_range("unknown model id");
  return specs_[i];
}

const ModelSpec& ModelRegistry::resolve(std::string_view key, Logger& log) const {
  if (auto id = find(key)) return get(*id);
  log.warn("unknown model '", key, "', using ", model_key(kDefaultModel));
  return get(kDefaultModel);
}

std::vector<ModelInfo> ModelRegistry::list() const {
  std::vector<ModelInfo> out;
  out.reserve(specs_.size());
  for (const auto& s : specs_) out.push_back(s.info());
  return out;
}

void ModelRegistry::validate() const {
  for (const auto& s : specs_) s.validate();
}

RacingModel::RacingModel(const ModelSpec& spec, const AeroModel& aero)
  : spec_(spec), speed_(aero, spec.speed), offsets_(spec.offsets) {
  spec_.refinement.validate();
}

std::vector<double> RacingModel::speeds(const TrackGeometry& geom, const VehicleParams& vehicle,
                                        double friction) const {
  return speed_.speeds(geom, vehicle, friction);
}

std::vector<Vec2> RacingModel::racing_line(const CurvilinearFrame& frame, const VehicleParams& vehicle,
                                           double friction, double track_width, Logger& log) const {
  const auto& g = frame.geometry();
  const auto v = speed_.speeds(g, vehicle, friction);
  const auto n = offsets_.offsets(g, v, track_width);
  auto line = OffsetSolver::apply(frame, n);

  if (spec_.refinement.enabled) {
    auto refined = refine_line(line, g.points, g.half_width, offsets_.max_offset(track_width),
                               speed_, vehicle, friction, spec_.refinement, log);
    log.debug(model_key(spec_.id), " refinement: ", refined.iterations, " iterations, lap ",
              refined.lap_time, " s");
    line = std::move(refined.line);
  }
  return line;
}

} // namespace rline

#include <rline/config.hpp>
#include <rline/track.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace rline {

namespace {

std::string join_key(const std::string& scope, const char* key) {
  return scope.empty() ? std::string(key) : scope + "." + key;
}

template <typename T>
T convert(const YAML::Node& value, const std::string& key) {
  try {
    return value.as<T>();
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config key '" + key + "': " + e.what());
  }
}

template <typename T>
T get_required_scalar(const YAML::Node& node, const char* key, const std::string& scope = {}) {
  auto value = node[key];
  if (!value) {
    throw std::runtime_error("missing key: " + join_key(scope, key));
  }
  return convert<T>(value, join_key(scope, key));
}

template <typename T>
void read_optional(const YAML::Node& node, const char* key, T& out, const std::string& scope) {
  if (auto value = node[key]) out = convert<T>(value, join_key(scope, key));
}

void parse_aero(const YAML::Node& node, AeroConfig& cfg) {
  const std::string s = "aero";
  read_optional(node, "air_density", cfg.air_density, s);
  read_optional(node, "speeds", cfg.speeds, s);
  read_optional(node, "drag", cfg.drag, s);
  read_optional(node, "lift", cfg.lift, s);
  read_optional(node, "center_of_pressure", cfg.center_of_pressure, s);
  read_optional(node, "reference_drag", cfg.reference_drag, s);
  read_optional(node, "reference_lift", cfg.reference_lift, s);
  read_optional(node, "max_lookup_speed", cfg.max_lookup_speed, s);
  read_optional(node, "min_drag", cfg.min_drag, s);
  read_optional(node, "max_drag", cfg.max_drag, s);
  read_optional(node, "min_lift", cfg.min_lift, s);
  read_optional(node, "max_lift", cfg.max_lift, s);
  read_optional(node, "min_cop", cfg.min_cop, s);
  read_optional(node, "max_cop", cfg.max_cop, s);
  read_optional(node, "initial_speed", cfg.initial_speed, s);
  read_optional(node, "max_iterations", cfg.max_iterations, s);
  read_optional(node, "tolerance", cfg.tolerance, s);
  read_optional(node, "min_top_speed", cfg.min_top_speed, s);
  read_optional(node, "max_top_speed", cfg.max_top_speed, s);
}

void parse_lanes(const YAML::Node& node, LaneSettings& cfg) {
  const std::string s = "optimizer.lanes";
  read_optional(node, "min_separation", cfg.min_separation, s);
  read_optional(node, "width_fraction", cfg.width_fraction, s);
  read_optional(node, "spacing_margin", cfg.spacing_margin, s);
  read_optional(node, "boundary_fraction", cfg.boundary_fraction, s);
  read_optional(node, "max_vehicles", cfg.max_vehicles, s);
  read_optional(node, "smoothing_sigmas", cfg.smoothing_sigmas, s);
}

void parse_optimizer(const YAML::Node& node, OptimizerConfig& cfg) {
  const std::string s = "optimizer";
  read_optional(node, "resample_points", cfg.resample_points, s);
  read_optional(node, "min_resample_points", cfg.min_resample_points, s);
  read_optional(node, "worker_threads", cfg.worker_threads, s);
  read_optional(node, "fallback_speed", cfg.fallback_speed, s);
  if (auto lanes = node["lanes"]) parse_lanes(lanes, cfg.lanes);
}

void parse_speed(const YAML::Node& node, SpeedSettings& cfg, const std::string& s) {
  if (auto m = node["method"]) {
    const auto key = convert<std::string>(m, s + ".method");
    auto method = parse_speed_method(key);
    if (!method) throw std::runtime_error("config key '" + s + ".method': unknown method '" + key + "'");
    cfg.method = *method;
  }
  read_optional(node, "min_speed", cfg.min_speed, s);
  read_optional(node, "max_speed", cfg.max_speed, s);
  read_optional(node, "smoothing_sigma", cfg.smoothing_sigma, s);
  read_optional(node, "brake_force_ratio", cfg.brake_force_ratio, s);
  read_optional(node, "accel_lateral_scale", cfg.accel_lateral_scale, s);
  read_optional(node, "accel_max_loss", cfg.accel_max_loss, s);
  read_optional(node, "brake_lateral_scale", cfg.brake_lateral_scale, s);
  read_optional(node, "brake_max_loss", cfg.brake_max_loss, s);
}

void parse_offsets(const YAML::Node& node, OffsetSettings& cfg, const std::string& s) {
  read_optional(node, "usage_fraction", cfg.usage_fraction, s);
  read_optional(node, "corner_threshold", cfg.corner_threshold, s);
  read_optional(node, "curvature_sigma", cfg.curvature_sigma, s);
  read_optional(node, "phase_window", cfg.phase_window, s);
  read_optional(node, "look_ahead", cfg.look_ahead, s);
  read_optional(node, "sustained_tolerance", cfg.sustained_tolerance, s);
  read_optional(node, "apex_weight", cfg.apex_weight, s);
  read_optional(node, "entry_weight", cfg.entry_weight, s);
  read_optional(node, "exit_weight", cfg.exit_weight, s);
  read_optional(node, "sustained_weight", cfg.sustained_weight, s);
  read_optional(node, "setup_weight", cfg.setup_weight, s);
  read_optional(node, "severity_gain", cfg.severity_gain, s);
  read_optional(node, "default_speed_factor", cfg.default_speed_factor, s);
  read_optional(node, "smoothing_sigmas", cfg.smoothing_sigmas, s);
  read_optional(node, "refit_stride", cfg.refit_stride, s);

  // speed_tiers: [[below, factor], ...]
  if (auto tiers = node["speed_tiers"]) {
    const auto raw = convert<std::vector<std::vector<double>>>(tiers, s + ".speed_tiers");
    cfg.speed_tiers.clear();
    for (const auto& t : raw) {
      if (t.size() != 2) throw std::runtime_error("config key '" + s + ".speed_tiers': expected [speed, factor] pairs");
      cfg.speed_tiers.push_back(SpeedTier{t[0], t[1]});
    }
  }
}

void parse_refinement(const YAML::Node& node, RefinementSettings& cfg, const std::string& s) {
  read_optional(node, "enabled", cfg.enabled, s);
  read_optional(node, "max_iterations", cfg.max_iterations, s);
  read_optional(node, "convergence", cfg.convergence, s);
  read_optional(node, "percentile", cfg.percentile, s);
  read_optional(node, "reference_speed", cfg.reference_speed, s);
  read_optional(node, "max_speed_factor", cfg.max_speed_factor, s);
}

void parse_models(const YAML::Node& node, ModelRegistry& registry) {
  if (!node.IsMap()) throw std::runtime_error("config key 'models': expected a map of model ids");
  for (const auto& entry : node) {
    const auto key = convert<std::string>(entry.first, "models");
    const auto id = parse_model_id(key);
    if (!id) throw std::runtime_error("config key 'models." + key + "': unknown model id");

    ModelSpec& spec = registry.get(*id);
    const YAML::Node& body = entry.second;
    const std::string s = "models." + key;
    read_optional(body, "name", spec.name, s);
    read_optional(body, "description", spec.description, s);
    read_optional(body, "characteristics", spec.characteristics, s);
    if (auto n = body["speed"]) parse_speed(n, spec.speed, s + ".speed");
    if (auto n = body["offsets"]) parse_offsets(n, spec.offsets, s + ".offsets");
    if (auto n = body["refinement"]) parse_refinement(n, spec.refinement, s + ".refinement");
  }
}

EngineConfig parse_engine(const YAML::Node& root) {
  EngineConfig cfg;
  if (!root || root.IsNull()) return cfg;
  if (!root.IsMap()) throw std::runtime_error("engine config must be a YAML map");

  if (auto n = root["aero"]) parse_aero(n, cfg.aero);
  if (auto n = root["optimizer"]) parse_optimizer(n, cfg.optimizer);
  if (auto n = root["models"]) parse_models(n, cfg.registry);
  cfg.validate();
  return cfg;
}

VehicleParams parse_vehicle(const YAML::Node& node, std::size_t index) {
  const std::string s = "vehicles[" + std::to_string(index) + "]";
  VehicleParams v;
  v.id = get_required_scalar<std::string>(node, "id", s);
  read_optional(node, "mass", v.mass, s);
  read_optional(node, "length", v.length, s);
  read_optional(node, "width", v.width, s);
  read_optional(node, "max_steering_angle", v.max_steering_angle_deg, s);
  read_optional(node, "max_acceleration", v.max_acceleration, s);
  read_optional(node, "drag_coefficient", v.drag_coefficient, s);
  read_optional(node, "lift_coefficient", v.lift_coefficient, s);
  if (auto a = node["frontal_area"]) v.frontal_area = convert<double>(a, s + ".frontal_area");
  return v;
}

std::vector<Vec2> parse_points(const YAML::Node& node) {
  const auto raw = convert<std::vector<std::vector<double>>>(node, "track.points");
  std::vector<Vec2> pts;
  pts.reserve(raw.size());
  for (const auto& p : raw) {
    if (p.size() != 2) throw std::runtime_error("config key 'track.points': expected [x, y] pairs");
    pts.push_back({p[0], p[1]});
  }
  return pts;
}

Scenario parse_scenario(const YAML::Node& root, const std::filesystem::path& base_dir) {
  if (!root.IsMap()) throw std::runtime_error("scenario must be a YAML map");

  Scenario sc;
  read_optional(root, "name", sc.name, "");
  auto& req = sc.request;

  std::optional<TrackPreset> preset;
  auto track = root["track"];
  if (!track) throw std::runtime_error("missing key: track");
  if (auto p = track["preset"]) {
    const auto key = convert<std::string>(p, "track.preset");
    preset = track_by_key(key);
    if (!preset) throw std::runtime_error("config key 'track.preset': unknown preset '" + key + "'");
    req.track_points = preset->points;
    if (sc.name.empty()) sc.name = preset->name;
  } else if (auto p = track["points"]) {
    req.track_points = parse_points(p);
  } else if (auto p = track["csv"]) {
    auto path = std::filesystem::path(convert<std::string>(p, "track.csv"));
    if (path.is_relative() && !base_dir.empty()) path = base_dir / path;
    auto pts = load_centerline_csv(path.string());
    if (!pts) throw std::runtime_error("config key 'track.csv': cannot open " + path.string());
    req.track_points = std::move(*pts);
  } else {
    throw std::runtime_error("config key 'track': expected one of preset, points, csv");
  }

  if (preset) {
    req.track_width = preset->width;
    req.friction = preset->friction;
    read_optional(root, "width", req.track_width, "");
    read_optional(root, "friction", req.friction, "");
  } else {
    req.track_width = get_required_scalar<double>(root, "width");
    req.friction = get_required_scalar<double>(root, "friction");
  }
  req.model_id = model_key(kDefaultModel);
  read_optional(root, "model", req.model_id, "");

  if (auto vs = root["vehicles"]) {
    if (!vs.IsSequence()) throw std::runtime_error("config key 'vehicles': expected a list");
    for (std::size_t i = 0; i < vs.size(); ++i) req.vehicles.push_back(parse_vehicle(vs[i], i));
  }
  return sc;
}

YAML::Node load_text(const std::string& text) {
  try {
    return YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("malformed YAML: ") + e.what());
  }
}

YAML::Node load_file(const std::filesystem::path& path) {
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot load " + path.string() + ": " + e.what());
  }
}

} // namespace

std::optional<SpeedMethod> parse_speed_method(const std::string& key) {
  if (key == speed_method_name(SpeedMethod::ClosedForm)) return SpeedMethod::ClosedForm;
  if (key == speed_method_name(SpeedMethod::ForwardBackward)) return SpeedMethod::ForwardBackward;
  return std::nullopt;
}

void EngineConfig::validate() const {
  registry.validate();
  aero.validate();
  optimizer.validate();
}

EngineConfig engine_config_from_yaml(const std::string& text) {
  return parse_engine(load_text(text));
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
  return parse_engine(load_file(path));
}

Scenario scenario_from_yaml(const std::string& text, const std::filesystem::path& base_dir) {
  return parse_scenario(load_text(text), base_dir);
}

Scenario load_scenario(const std::filesystem::path& path) {
  return parse_scenario(load_file(path), path.parent_path());
}

} // namespace rline

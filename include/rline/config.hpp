#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <rline/aero.hpp>
#include <rline/models.hpp>
#include <rline/optimizer.hpp>

namespace rline {

// Process-wide engine settings. Every YAML key is optional and overrides the
// compiled-in default.
struct EngineConfig {
  ModelRegistry registry;
  AeroConfig aero;
  OptimizerConfig optimizer;

  void validate() const;
};

// Parse errors, missing files and wrong value types throw std::runtime_error
// naming the key; out-of-range values throw std::invalid_argument.
EngineConfig engine_config_from_yaml(const std::string& text);
EngineConfig load_engine_config(const std::filesystem::path& path);

// One optimization request described in YAML. The track comes from inline
// `points`, a catalog `preset` or a `csv` file (relative to base_dir).
struct Scenario {
  std::string name;
  OptimizeRequest request;
};

Scenario scenario_from_yaml(const std::string& text, const std::filesystem::path& base_dir = {});
Scenario load_scenario(const std::filesystem::path& path);

std::optional<SpeedMethod> parse_speed_method(const std::string& key);

} // namespace rline

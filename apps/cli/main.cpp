#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <rline/aero.hpp>
#include <rline/config.hpp>
#include <rline/log.hpp>
#include <rline/optimizer.hpp>

using namespace rline;

namespace {

void usage_(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <scenario.yaml> [--config engine.yaml] [--csv out.csv] [--verbose]\n"
            << "       " << argv0 << " --list-models [--config engine.yaml]\n";
}

void write_csv_(std::ostream& out, const std::vector<VehicleResult>& results) {
  out << "vehicle,index,x,y,speed\n";
  out << std::setprecision(10);
  for (const auto& r : results) {
    for (std::size_t i = 0; i < r.coordinates.size(); ++i) {
      const double v = i < r.speeds.size() ? r.speeds[i] : 0.0;
      out << r.vehicle_id << ',' << i << ',' << r.coordinates[i].x << ',' << r.coordinates[i].y << ',' << v << '\n';
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string scenario_path, config_path, csv_path;
  bool list_models = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    if (std::strcmp(a, "--config") == 0 && i + 1 < argc) config_path = argv[++i];
    else if (std::strcmp(a, "--csv") == 0 && i + 1 < argc) csv_path = argv[++i];
    else if (std::strcmp(a, "--list-models") == 0) list_models = true;
    else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) verbose = true;
    else if (a[0] != '-' && scenario_path.empty()) scenario_path = a;
    else { usage_(argv[0]); return 2; }
  }
  if (!list_models && scenario_path.empty()) { usage_(argv[0]); return 2; }

  StreamLogger log(std::cerr, verbose ? LogLevel::Debug : LogLevel::Info);

  try {
    const EngineConfig cfg = config_path.empty() ? EngineConfig{} : load_engine_config(config_path);
    const AeroModel aero(cfg.aero);
    const RacingLineOptimizer optimizer(cfg.registry, aero, cfg.optimizer, log);

    if (list_models) {
      for (const auto& m : optimizer.list_models()) {
        std::cout << m.id << "  " << m.name << "  (track usage " << m.track_usage_fraction * 100.0 << "%)\n"
                  << "    " << m.description << '\n';
        for (const auto& c : m.characteristics) std::cout << "    - " << c << '\n';
      }
      return 0;
    }

    const Scenario sc = load_scenario(scenario_path);
    log.info("scenario ", sc.name.empty() ? scenario_path : sc.name, ": ", sc.request.track_points.size(),
             " points, width ", sc.request.track_width, " m, friction ", sc.request.friction);
    const auto results = optimizer.optimize(sc.request);

    std::cout << std::fixed << std::setprecision(3);
    for (const auto& r : results) {
      std::cout << r.vehicle_id << "  model=" << r.model_id << "  lap=" << r.lap_time << " s  points="
                << r.coordinates.size() << (r.fallback ? "  (centerline fallback)" : "") << '\n';
    }

    if (!csv_path.empty()) {
      std::ofstream out(csv_path);
      if (!out) {
        log.error("cannot write ", csv_path);
        return 1;
      }
      write_csv_(out, results);
    }
  } catch (const std::invalid_argument& e) {
    log.error("invalid input: ", e.what());
    return 2;
  } catch (const std::exception& e) {
    log.error(e.what());
    return 1;
  }
  return 0;
}

#include <exception>
#include <iostream>
#include <rline/aero.hpp>
#include <rline/config.hpp>
#include <rline/log.hpp>
#include <rline/optimizer.hpp>
#include <rline/viewer/app.hpp>

using namespace rline;

int main(int argc, char** argv) {
  StreamLogger log(std::cerr, LogLevel::Info);

  EngineConfig cfg;
  if (argc > 1) {
    try {
      cfg = load_engine_config(argv[1]);
    } catch (const std::exception& e) {
      log.error("config: ", e.what());
      return 1;
    }
  }

  const AeroModel aero(cfg.aero);
  const RacingLineOptimizer optimizer(cfg.registry, aero, cfg.optimizer, log);

  ViewerApp app(optimizer, log);
  return app.run();
}

#include <cstdlib>
#include <iostream>
#include <string>
#include "app/bootstrap.hpp"
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"

namespace config = datastore::config;
namespace logging = datastore::logging;

bool run_bootstrap(const config::Config& settings) {
  try {
    datastore::app::Bootstrap bootstrap(settings);
    if (!bootstrap.start()) {
      std::cerr << "Error: Failed to start datastore\n";
      return false;
    }

    datastore::cli::CLI cli(bootstrap);
    cli.run();
    return bootstrap.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start datastore: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  config::Config settings;
  try {
    settings = config::load(argc, argv, [](const char* name) { return std::getenv(name); });
  } catch (const config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n' << config::usage(argv[0]);
    return 1;
  }

  logging::init_logging(settings.log_file,
                        settings.verbose ? logging::severity_level::debug : logging::severity_level::info,
                        settings.verbose);

  return run_bootstrap(settings) ? 0 : 1;
}

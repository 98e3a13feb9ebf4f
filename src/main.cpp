// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "application.hpp"
#include "config.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
  bitwire::app::NodeConfig config;
  try {
    config = bitwire::app::NodeConfig::FromArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"
              << "Run with --help for usage.\n";
    return 1;
  }

  if (config.show_help) {
    std::cout << bitwire::app::GetUsage(argv[0]);
    return 0;
  }
  if (config.show_version) {
    std::cout << bitwire::CLIENT_NAME << " version " << bitwire::GetFullVersion() << std::endl;
    return 0;
  }

  const std::string log_file = config.ResolvedLogFile();
  bitwire::util::LogManager::Initialize(config.log_level, !log_file.empty(), log_file);

  int exit_code = 0;
  {
    bitwire::app::Application app(config);
    if (!app.initialize() || !app.start()) {
      LOG_ERROR("Failed to start bitwire");
      exit_code = 1;
    } else {
      app.wait_for_shutdown();
    }
  }

  bitwire::util::LogManager::Shutdown();
  return exit_code;
}

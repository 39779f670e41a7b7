// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"
#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

int main(int argc, char* argv[]) {
  using namespace proxyscan;

  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    app::AppConfig config;
    try {
      config = app::ParseArgs(args);
    } catch (const app::ConfigError& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }

    if (config.show_help) {
      std::cout << app::GetUsage(argv[0]);
      return 0;
    }
    if (config.show_version) {
      std::cout << GetFullVersionString() << std::endl;
      return 0;
    }

    util::LogManager::Initialize(config.log_level, config.log_file.has_value(),
                                 config.log_file ? config.log_file->string() : std::string());

    int exit_code = 0;
    {
      app::Application application(config, std::cout, isatty(STDOUT_FILENO) != 0);
      application.initialize();
      exit_code = application.run();
    }

    util::LogManager::Shutdown();
    return exit_code;
  } catch (const std::exception& e) {
    std::cout << std::flush;
    std::cerr << "Error: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}

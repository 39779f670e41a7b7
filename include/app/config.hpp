// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate.hpp"
#include "scan/candidate_channel.hpp"
#include "scan/range_scanner.hpp"
#include "verify/http_proxy_verifier.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxyscan {
namespace app {

// Bad command line. what() is printed after "Error: ".
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct AppConfig {
  // Candidate source: exactly one of these is set after ParseArgs()
  std::optional<std::string> subnet;
  std::optional<std::filesystem::path> input;

  uint16_t port{scan::DEFAULT_PROXY_PORT};
  std::chrono::milliseconds scan_timeout{scan::DEFAULT_SCAN_TIMEOUT};
  std::chrono::seconds test_timeout{verify::DEFAULT_TEST_TIMEOUT};
  bool verbose{false};
  std::optional<std::filesystem::path> output;

  std::string geo_url{verify::DEFAULT_GEO_URL};
  size_t queue_size{scan::CandidateChannel::DEFAULT_CAPACITY};

  std::string log_level{"off"};
  std::optional<std::filesystem::path> log_file;

  bool show_help{false};
  bool show_version{false};
};

// Parse command-line arguments (without the program name).
// Accepts "--key=value", "--key value" and the short aliases -i, -p, -o,
// -v, -h. --help / --version stop parsing immediately.
// Throws ConfigError on unknown options, missing or invalid values, and
// unless exactly one of --subnet / --input is given.
AppConfig ParseArgs(const std::vector<std::string>& args);

// Usage text for --help
std::string GetUsage(const std::string& program_name);

}  // namespace app
}  // namespace proxyscan

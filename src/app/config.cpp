// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"

#include "util/string_parsing.hpp"
#include "verify/http_message.hpp"

#include <array>
#include <sstream>

namespace proxyscan {
namespace app {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr int MAX_SCAN_TIMEOUT_MS = 60 * 1000;
constexpr int MAX_TEST_TIMEOUT_SEC = 3600;
constexpr int MAX_QUEUE_SIZE = 1000000;

struct OptionSpec {
  const char* long_name;   // without leading "--"
  const char* short_name;  // "-x" or nullptr
  bool takes_value;
};

constexpr std::array<OptionSpec, 13> kOptions = {{
    {"subnet", nullptr, true},
    {"input", "-i", true},
    {"port", "-p", true},
    {"scan-timeout", nullptr, true},
    {"test-timeout", nullptr, true},
    {"verbose", "-v", false},
    {"output", "-o", true},
    {"geo-url", nullptr, true},
    {"queue-size", nullptr, true},
    {"loglevel", nullptr, true},
    {"logfile", nullptr, true},
    {"help", "-h", false},
    {"version", nullptr, false},
}};

const OptionSpec* FindOption(const std::string& arg, std::optional<std::string>& inline_value) {
  inline_value.reset();
  if (arg.starts_with("--")) {
    std::string name = arg.substr(2);
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    for (const auto& opt : kOptions) {
      if (name == opt.long_name) {
        return &opt;
      }
    }
    return nullptr;
  }
  for (const auto& opt : kOptions) {
    if (opt.short_name && arg == opt.short_name) {
      return &opt;
    }
  }
  return nullptr;
}

std::string RequireNonEmpty(const std::string& option, const std::string& value) {
  if (value.empty()) {
    throw ConfigError("--" + option + " requires a non-empty value");
  }
  return value;
}

int ParseBoundedInt(const std::string& option, const std::string& value, int min, int max) {
  auto parsed = util::SafeParseInt(value, min, max);
  if (!parsed) {
    std::ostringstream msg;
    msg << "invalid value for --" << option << ": '" << value << "' (expected an integer between " << min
        << " and " << max << ")";
    throw ConfigError(msg.str());
  }
  return *parsed;
}

}  // namespace

AppConfig ParseArgs(const std::vector<std::string>& args) {
  AppConfig config;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    std::optional<std::string> inline_value;
    const OptionSpec* opt = FindOption(arg, inline_value);
    if (!opt) {
      if (arg.starts_with("-")) {
        throw ConfigError("unknown option '" + arg + "' (see --help)");
      }
      throw ConfigError("unexpected argument '" + arg + "' (see --help)");
    }

    const std::string name = opt->long_name;
    std::string value;
    if (opt->takes_value) {
      if (inline_value) {
        value = *inline_value;
      } else if (i + 1 < args.size()) {
        value = args[++i];
      } else {
        throw ConfigError("--" + name + " requires a value");
      }
    } else if (inline_value) {
      throw ConfigError("--" + name + " does not take a value");
    }

    if (name == "help") {
      config.show_help = true;
      return config;
    } else if (name == "version") {
      config.show_version = true;
      return config;
    } else if (name == "subnet") {
      config.subnet = RequireNonEmpty(name, value);
    } else if (name == "input") {
      config.input = RequireNonEmpty(name, value);
    } else if (name == "port") {
      auto port = util::SafeParsePort(value);
      if (!port) {
        throw ConfigError("invalid value for --port: '" + value + "' (expected 1-65535)");
      }
      config.port = *port;
    } else if (name == "scan-timeout") {
      config.scan_timeout = std::chrono::milliseconds(ParseBoundedInt(name, value, 1, MAX_SCAN_TIMEOUT_MS));
    } else if (name == "test-timeout") {
      config.test_timeout = std::chrono::seconds(ParseBoundedInt(name, value, 1, MAX_TEST_TIMEOUT_SEC));
    } else if (name == "verbose") {
      config.verbose = true;
    } else if (name == "output") {
      config.output = RequireNonEmpty(name, value);
    } else if (name == "geo-url") {
      if (!verify::ParseHttpUrl(value)) {
        throw ConfigError("invalid value for --geo-url: '" + value + "' (only http:// URLs are supported)");
      }
      config.geo_url = value;
    } else if (name == "queue-size") {
      config.queue_size = static_cast<size_t>(ParseBoundedInt(name, value, 1, MAX_QUEUE_SIZE));
    } else if (name == "loglevel") {
      bool known = false;
      for (const char* level : kLogLevels) {
        known = known || value == level;
      }
      if (!known) {
        throw ConfigError("invalid value for --loglevel: '" + value +
                          "' (expected trace, debug, info, warn, error, critical or off)");
      }
      config.log_level = value;
    } else if (name == "logfile") {
      config.log_file = RequireNonEmpty(name, value);
    }
  }

  if (config.subnet && config.input) {
    throw ConfigError("--subnet and --input cannot be used together");
  }
  if (!config.subnet && !config.input) {
    throw ConfigError("one of --subnet or --input is required (see --help)");
  }

  return config;
}

std::string GetUsage(const std::string& program_name) {
  std::ostringstream out;
  out << "proxyscan - find and verify open HTTP proxies\n\n"
      << "Usage: " << program_name << " (--subnet=<cidr> | --input=<file>) [options]\n\n"
      << "Source (exactly one):\n"
      << "  --subnet=<cidr>        Scan an address range, e.g. 192.168.1.0/24\n"
      << "  -i, --input=<file>     Test addresses from a CSV file with an \"IP Address\" column\n"
      << "\n"
      << "Options:\n"
      << "  -p, --port=<port>      Port to scan, or default port for input records (default: "
      << scan::DEFAULT_PROXY_PORT << ")\n"
      << "  --scan-timeout=<ms>    Connect timeout per probed host in milliseconds (default: "
      << scan::DEFAULT_SCAN_TIMEOUT.count() << ")\n"
      << "  --test-timeout=<sec>   Timeout for each proxy test in seconds (default: "
      << verify::DEFAULT_TEST_TIMEOUT.count() << ")\n"
      << "  -v, --verbose          Print a line for every candidate as it is found and tested\n"
      << "  -o, --output=<file>    Save working proxies to a CSV file\n"
      << "  --geo-url=<url>        Geolocation endpoint requested through each proxy\n"
      << "                         (default: " << verify::DEFAULT_GEO_URL << ")\n"
      << "  --queue-size=<n>       Maximum candidates waiting for verification (default: "
      << scan::CandidateChannel::DEFAULT_CAPACITY << ")\n"
      << "\n"
      << "Diagnostics:\n"
      << "  --loglevel=<level>     trace, debug, info, warn, error, critical, off (default: off)\n"
      << "  --logfile=<file>       Also write diagnostics to a file\n"
      << "  --version              Show version information\n"
      << "  -h, --help             Show this help message\n";
  return out.str();
}

}  // namespace app
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"

using namespace proxyscan;
using namespace proxyscan::app;

TEST_CASE("ParseArgs: defaults", "[app][config]") {
    auto config = ParseArgs({"--subnet=192.168.1.0/24"});
    REQUIRE(config.subnet == std::optional<std::string>("192.168.1.0/24"));
    REQUIRE_FALSE(config.input);
    REQUIRE(config.port == 7890);
    REQUIRE(config.scan_timeout == std::chrono::milliseconds(200));
    REQUIRE(config.test_timeout == std::chrono::seconds(10));
    REQUIRE_FALSE(config.verbose);
    REQUIRE_FALSE(config.output);
    REQUIRE(config.geo_url == "http://ip-api.com/json");
    REQUIRE(config.queue_size == 200);
    REQUIRE(config.log_level == "off");
    REQUIRE_FALSE(config.log_file);
}

TEST_CASE("ParseArgs: option forms", "[app][config]") {
    SECTION("Separate values and short aliases") {
        auto config = ParseArgs({"-i", "proxies.csv", "-p", "3128", "-o", "out.csv", "-v", "--test-timeout", "5"});
        REQUIRE(config.input == std::optional<std::filesystem::path>("proxies.csv"));
        REQUIRE(config.port == 3128);
        REQUIRE(config.output == std::optional<std::filesystem::path>("out.csv"));
        REQUIRE(config.verbose);
        REQUIRE(config.test_timeout == std::chrono::seconds(5));
    }

    SECTION("Inline values") {
        auto config = ParseArgs({"--input=list.csv", "--scan-timeout=50", "--queue-size=8",
                                 "--geo-url=http://127.0.0.1:8080/json", "--loglevel=debug",
                                 "--logfile=scan.log"});
        REQUIRE(config.input == std::optional<std::filesystem::path>("list.csv"));
        REQUIRE(config.scan_timeout == std::chrono::milliseconds(50));
        REQUIRE(config.queue_size == 8);
        REQUIRE(config.geo_url == "http://127.0.0.1:8080/json");
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.log_file == std::optional<std::filesystem::path>("scan.log"));
    }

    SECTION("Help and version need no source") {
        REQUIRE(ParseArgs({"--help"}).show_help);
        REQUIRE(ParseArgs({"-h", "--bogus"}).show_help);
        REQUIRE(ParseArgs({"--version"}).show_version);
    }
}

TEST_CASE("ParseArgs: source selection", "[app][config]") {
    REQUIRE_THROWS_WITH(ParseArgs({}), "one of --subnet or --input is required (see --help)");
    REQUIRE_THROWS_WITH(ParseArgs({"-v"}), "one of --subnet or --input is required (see --help)");
    REQUIRE_THROWS_WITH(ParseArgs({"--subnet=10.0.0.0/24", "--input=x.csv"}),
                        "--subnet and --input cannot be used together");
}

TEST_CASE("ParseArgs: invalid values", "[app][config]") {
    const std::vector<std::vector<std::string>> bad = {
        {"--subnet=10.0.0.0/24", "--port=0"},
        {"--subnet=10.0.0.0/24", "--port=65536"},
        {"--subnet=10.0.0.0/24", "--port=http"},
        {"--subnet=10.0.0.0/24", "--scan-timeout=0"},
        {"--subnet=10.0.0.0/24", "--test-timeout=-1"},
        {"--subnet=10.0.0.0/24", "--queue-size=0"},
        {"--subnet=10.0.0.0/24", "--geo-url=https://ip-api.com/json"},
        {"--subnet=10.0.0.0/24", "--loglevel=verbose"},
        {"--subnet=10.0.0.0/24", "--verbose=yes"},
        {"--subnet="},
        {"--subnet"},
        {"--subnet=10.0.0.0/24", "--unknown"},
        {"--subnet=10.0.0.0/24", "stray"},
    };
    for (const auto& args : bad) {
        INFO("args: " << args.back());
        REQUIRE_THROWS_AS(ParseArgs(args), ConfigError);
    }
}

TEST_CASE("GetUsage lists every option", "[app][config]") {
    std::string usage = GetUsage("proxyscan");
    for (const char* opt : {"--subnet", "--input", "--port", "--scan-timeout", "--test-timeout", "--verbose",
                            "--output", "--geo-url", "--queue-size", "--loglevel", "--logfile", "--version",
                            "--help"}) {
        INFO(opt);
        REQUIRE(usage.find(opt) != std::string::npos);
    }
    REQUIRE(usage.find("default: 7890") != std::string::npos);
}

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/console.hpp"
#include "application.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace proxyscan;
using namespace proxyscan::app;

namespace {

scan::Candidate Cand(const std::string& ip, uint16_t port = 7890) {
    return scan::Candidate{asio::ip::make_address(ip), port};
}

verify::ProxyResult Result(const std::string& ip, uint64_t ms, const std::string& location) {
    return verify::ProxyResult{asio::ip::make_address(ip), ms, location};
}

}  // namespace

TEST_CASE("ConsoleReporter: verbose event lines", "[app][console]") {
    asio::io_context io;
    std::ostringstream out;
    ConsoleReporter console(io, out, true, false);
    console.BeginProgress(std::nullopt, "Scanning subnet...");

    console.OnCandidate(Cand("192.0.2.1"));
    console.OnSuccess(Cand("192.0.2.1"), Result("192.0.2.1", 48, "Paris, France"));
    console.OnCandidate(Cand("192.0.2.2"));
    console.OnFailure(Cand("192.0.2.2"), "timed out after 10 s");
    console.OnFinished(scan::PipelineStats{});

    REQUIRE(out.str() ==
            "[FOUND]   Potential proxy at 192.0.2.1:7890\n"
            "[SUCCESS] 192.0.2.1 connected in 48ms\n"
            "[GEO]     192.0.2.1 located in Paris, France\n"
            "[FOUND]   Potential proxy at 192.0.2.2:7890\n"
            "[FAIL]    192.0.2.2:7890: timed out after 10 s\n");
    REQUIRE(console.position() == 2);
}

TEST_CASE("ConsoleReporter: quiet mode still reports faults", "[app][console]") {
    asio::io_context io;
    std::ostringstream out;
    ConsoleReporter console(io, out, false, false);
    console.BeginProgress(3, "");

    console.OnCandidate(Cand("192.0.2.1"));
    console.OnFailure(Cand("192.0.2.1"), "connect failed: Connection refused");
    console.OnFault(Cand("192.0.2.3"), "verification unit threw: boom");
    console.OnFinished(scan::PipelineStats{});

    REQUIRE(out.str() == "[ERROR]   A test task failed for 192.0.2.3:7890: verification unit threw: boom\n");
}

TEST_CASE("ConsoleReporter: progress line", "[app][console]") {
    asio::io_context io;
    std::ostringstream out;

    SECTION("Bar when the total is known") {
        ConsoleReporter console(io, out, false, false);
        console.BeginProgress(4, "");
        console.OnFailure(Cand("192.0.2.1"), "x");
        std::string line = console.ProgressLine();
        REQUIRE(line.find("1/4 (25%)") != std::string::npos);
        REQUIRE(line.find("[" + std::string(10, '#') + std::string(30, '-') + "]") != std::string::npos);
    }

    SECTION("Spinner with counts otherwise") {
        ConsoleReporter console(io, out, false, false);
        console.BeginProgress(std::nullopt, "Scanning subnet...");
        console.OnCandidate(Cand("192.0.2.1"));
        console.OnCandidate(Cand("192.0.2.2"));
        console.OnSuccess(Cand("192.0.2.1"), Result("192.0.2.1", 5, "A, B"));
        REQUIRE(console.ProgressLine().find("Scanning subnet... (2 found, 1 tested)") != std::string::npos);
    }

    // Nothing is drawn when the output is not a terminal
    REQUIRE(out.str().empty());
}

TEST_CASE("ConsoleReporter: interactive output", "[app][console]") {
    asio::io_context io;
    std::ostringstream out;
    ConsoleReporter console(io, out, true, true);
    console.BeginProgress(1, "");
    console.OnFailure(Cand("192.0.2.1"), "x");
    console.OnFinished(scan::PipelineStats{});
    io.run();  // the cancelled tick must not redraw

    std::string s = out.str();
    REQUIRE(s.find("\033[1;31m[FAIL]\033[0m") != std::string::npos);
    REQUIRE(s.find("All tasks completed!\n") != std::string::npos);
    REQUIRE(s.substr(s.size() - std::string("All tasks completed!\n").size()) == "All tasks completed!\n");
}

TEST_CASE("FormatResultsTable", "[app][console]") {
    std::string table = FormatResultsTable({Result("192.0.2.1", 42, "Paris, France"),
                                            Result("198.51.100.23", 310, "São Paulo, Brazil")});

    const std::string expected =
        "┌──────┬───────────────┬───────────────┬───────────────────┐\n"
        "│ Rank ┆ IP Address    ┆ Response Time ┆ Location          │\n"
        "╞══════╪═══════════════╪═══════════════╪═══════════════════╡\n"
        "│ 1    ┆ 192.0.2.1     ┆ 42 ms         ┆ Paris, France     │\n"
        "├╌╌╌╌╌╌┼╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌┼╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌┼╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌╌┤\n"
        "│ 2    ┆ 198.51.100.23 ┆ 310 ms        ┆ São Paulo, Brazil │\n"
        "└──────┴───────────────┴───────────────┴───────────────────┘\n";
    REQUIRE(table == expected);
}

TEST_CASE("Application: empty input prints the no-results summary", "[app][console]") {
    auto input = std::filesystem::temp_directory_path() / "proxyscan_app_empty.csv";
    auto output = std::filesystem::temp_directory_path() / "proxyscan_app_empty_out.csv";
    {
        std::ofstream f(input, std::ios::binary);
        f << "IP Address\nnot-an-address\n";
    }
    std::error_code ec;
    std::filesystem::remove(output, ec);

    auto config = ParseArgs({"--input=" + input.string(), "--output=" + output.string()});
    std::ostringstream out;
    Application app(config, out, false);
    app.initialize();
    REQUIRE(app.run() == 0);

    REQUIRE(out.str() == "\nNo working HTTP proxies were found.\n");
    REQUIRE(app.report().stats.candidates == 0);
    // No report is written when nothing was found
    REQUIRE_FALSE(std::filesystem::exists(output));

    std::filesystem::remove(input, ec);
}

TEST_CASE("Application: malformed input fails during initialize", "[app][console]") {
    auto input = std::filesystem::temp_directory_path() / "proxyscan_app_bad.csv";
    {
        std::ofstream f(input, std::ios::binary);
        f << "Host,Port\n192.0.2.1,8080\n";
    }
    auto config = ParseArgs({"--input=" + input.string()});
    std::ostringstream out;
    Application app(config, out, false);
    REQUIRE_THROWS_AS(app.initialize(), scan::SourceError);

    std::error_code ec;
    std::filesystem::remove(input, ec);
}

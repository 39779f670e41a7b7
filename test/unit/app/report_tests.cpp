// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/report.hpp"
#include "scan/candidate_file_reader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace proxyscan;
using namespace proxyscan::app;

namespace {

verify::ProxyResult Result(const std::string& ip, uint64_t ms, const std::string& location) {
    return verify::ProxyResult{asio::ip::make_address(ip), ms, location};
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE("FormatCsvReport", "[app][report]") {
    SECTION("Header only for no results") {
        REQUIRE(FormatCsvReport({}) == "IP Address,Response Time (ms),Location\n");
    }

    SECTION("Locations with commas are quoted") {
        std::string csv = FormatCsvReport({Result("192.0.2.1", 42, "Paris, France"),
                                           Result("192.0.2.2", 57, "Unknown, Unknown"),
                                           Result("2001:db8::1", 90, "Say \"hi\", Nowhere")});
        REQUIRE(csv ==
                "IP Address,Response Time (ms),Location\n"
                "192.0.2.1,42,\"Paris, France\"\n"
                "192.0.2.2,57,\"Unknown, Unknown\"\n"
                "2001:db8::1,90,\"Say \"\"hi\"\", Nowhere\"\n");
    }
}

TEST_CASE("WriteCsvReport output can be read back as input", "[app][report]") {
    auto path = std::filesystem::temp_directory_path() / "proxyscan_report_roundtrip.csv";
    std::vector<verify::ProxyResult> results = {Result("198.51.100.4", 12, "Tokyo, Japan"),
                                                Result("198.51.100.9", 80, "Unknown, Unknown")};

    WriteCsvReport(path, results);
    REQUIRE(ReadFile(path) == FormatCsvReport(results));

    scan::CandidateFileReader reader(path, 7890);
    auto candidates = reader.ReadAll();
    REQUIRE(candidates.size() == 2);
    REQUIRE(candidates[0].ToString() == "198.51.100.4:7890");
    REQUIRE(candidates[1].ToString() == "198.51.100.9:7890");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("WriteCsvReport reports unwritable destinations", "[app][report]") {
    // Parent "directory" is a regular file
    auto blocker = std::filesystem::temp_directory_path() / "proxyscan_report_blocker";
    {
        std::ofstream f(blocker);
        f << "x";
    }

    REQUIRE_THROWS_AS(WriteCsvReport(blocker / "out.csv", {Result("192.0.2.1", 1, "A, B")}), ReportError);

    std::error_code ec;
    std::filesystem::remove(blocker, ec);
}

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "verify/verification.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxyscan {
namespace app {

class ReportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// CSV with header "IP Address,Response Time (ms),Location" and one row per
// result, in the given order. Readable back as an input file.
std::string FormatCsvReport(const std::vector<verify::ProxyResult>& results);

// Write FormatCsvReport(results) to path atomically. Throws ReportError.
void WriteCsvReport(const std::filesystem::path& path, const std::vector<verify::ProxyResult>& results);

}  // namespace app
}  // namespace proxyscan

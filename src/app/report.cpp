// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/report.hpp"

#include "scan/candidate_file_reader.hpp"
#include "util/csv.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

namespace proxyscan {
namespace app {

std::string FormatCsvReport(const std::vector<verify::ProxyResult>& results) {
  std::string csv = util::FormatCsvRecord({scan::IP_ADDRESS_COLUMN, "Response Time (ms)", "Location"}) + "\n";
  for (const auto& result : results) {
    csv += util::FormatCsvRecord(
               {result.address.to_string(), std::to_string(result.response_time_ms), result.location}) +
           "\n";
  }
  return csv;
}

void WriteCsvReport(const std::filesystem::path& path, const std::vector<verify::ProxyResult>& results) {
  if (!util::atomic_write_file(path, FormatCsvReport(results))) {
    throw ReportError("failed to write report to '" + path.string() + "'");
  }
  LOG_APP_INFO("wrote {} results to {}", results.size(), path.string());
}

}  // namespace app
}  // namespace proxyscan

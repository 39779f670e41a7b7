// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/config.hpp"
#include "scan/address_source.hpp"
#include "scan/scan_pipeline.hpp"
#include "verify/proxy_verifier.hpp"

#include <memory>
#include <ostream>

#include <asio/io_context.hpp>

namespace proxyscan {
namespace app {

// Application - one scan run: builds the candidate source and verifier from
// the configuration, runs the pipeline, prints the summary and writes the
// optional CSV report.
class Application {
public:
  // interactive: out is a terminal (enables the live progress display)
  Application(const AppConfig& config, std::ostream& out, bool interactive);
  ~Application();

  // Build source and verifier. In file mode the input is parsed once here,
  // so a missing or malformed file fails before any proxy is contacted.
  // Throws scan::SourceError or std::invalid_argument.
  void initialize();

  // Run the pipeline and report. Returns the process exit code.
  // Throws scan::SourceError if the source failed part-way and ReportError
  // if the CSV report cannot be written.
  int run();

  const scan::ScanReport& report() const { return report_; }

private:
  void print_summary();

  AppConfig config_;
  std::ostream& out_;
  bool interactive_;

  asio::io_context io_context_;
  std::unique_ptr<scan::AddressSource> source_;
  std::unique_ptr<verify::ProxyVerifier> verifier_;
  scan::ScanReport report_;
};

}  // namespace app
}  // namespace proxyscan

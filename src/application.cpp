// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"

#include "app/console.hpp"
#include "app/report.hpp"
#include "scan/candidate_file_reader.hpp"
#include "scan/range_scanner.hpp"
#include "util/logging.hpp"
#include "verify/http_proxy_verifier.hpp"
#include "version.hpp"

#include <memory>
#include <stdexcept>

namespace proxyscan {
namespace app {

Application::Application(const AppConfig& config, std::ostream& out, bool interactive)
    : config_(config), out_(out), interactive_(interactive) {}

Application::~Application() = default;

void Application::initialize() {
  LOG_APP_INFO("{} starting", GetFullVersionString());

  if (config_.input) {
    auto reader = std::make_unique<scan::CandidateFileReader>(*config_.input, config_.port);
    uint64_t count = reader->CountCandidates();
    LOG_APP_INFO("input file {}: {} candidates", config_.input->string(), count);
    source_ = std::move(reader);
  } else if (config_.subnet) {
    LOG_APP_INFO("scanning {} on port {}", *config_.subnet, config_.port);
    source_ = std::make_unique<scan::RangeScanner>(*config_.subnet, config_.port, config_.scan_timeout);
  } else {
    throw std::invalid_argument("no candidate source configured");
  }

  verify::VerifierConfig verifier_config;
  verifier_config.geo_url = config_.geo_url;
  verifier_config.timeout = config_.test_timeout;
  verifier_ = std::make_unique<verify::HttpProxyVerifier>(io_context_, verifier_config);
}

int Application::run() {
  if (!source_ || !verifier_) {
    initialize();
  }

  ConsoleReporter console(io_context_, out_, config_.verbose, interactive_);
  console.BeginProgress(source_->ExpectedCount(), "Scanning subnet...");

  scan::ScanPipeline pipeline(*source_, *verifier_, io_context_, config_.queue_size, &console);
  report_ = pipeline.Run();

  if (report_.source_error) {
    throw scan::SourceError(*report_.source_error);
  }

  print_summary();

  if (config_.output && !report_.results.empty()) {
    WriteCsvReport(*config_.output, report_.results);
    out_ << "\nResults saved to " << config_.output->string() << std::endl;
  }
  return 0;
}

void Application::print_summary() {
  if (report_.results.empty()) {
    out_ << "\nNo working HTTP proxies were found." << std::endl;
    return;
  }
  out_ << "\n--- Final Results ---\n" << FormatResultsTable(report_.results) << std::flush;
}

}  // namespace app
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/pipeline_observer.hpp"
#include "verify/verification.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace proxyscan {
namespace app {

// ConsoleReporter - user-facing progress and event lines.
//
// Progress is a bar when the number of candidates is known up front (input
// file) and a spinner otherwise (range scan). It is redrawn in place from a
// 100 ms timer on the pipeline's io_context and only when the output is a
// terminal. Event lines (FOUND / SUCCESS / GEO / FAIL) are printed above the
// progress line when verbose is set; execution faults (ERROR) are always
// printed.
class ConsoleReporter : public scan::PipelineObserver {
public:
  static constexpr std::chrono::milliseconds TICK_INTERVAL{100};
  static constexpr size_t BAR_WIDTH = 40;

  ConsoleReporter(asio::io_context& io_context, std::ostream& out, bool verbose, bool interactive);

  // total set: bar over total completed units; nullopt: spinner with message
  void BeginProgress(std::optional<uint64_t> total, std::string message);

  void OnCandidate(const scan::Candidate& candidate) override;
  void OnSuccess(const scan::Candidate& candidate, const verify::ProxyResult& result) override;
  void OnFailure(const scan::Candidate& candidate, const std::string& reason) override;
  void OnFault(const scan::Candidate& candidate, const std::string& reason) override;
  void OnFinished(const scan::PipelineStats& stats) override;

  uint64_t position() const { return position_; }

  // Current progress line (without terminal control sequences)
  std::string ProgressLine() const;

private:
  void ScheduleTick();
  void Redraw();
  void PrintEvent(const std::string& tag, const char* color, const std::string& text);

  asio::steady_timer timer_;
  std::ostream& out_;
  bool verbose_;
  bool interactive_;

  bool active_{false};
  std::optional<uint64_t> total_;
  std::string message_;
  uint64_t position_{0};
  uint64_t found_{0};
  size_t spinner_frame_{0};
  std::chrono::steady_clock::time_point started_;
};

// Render results as a UTF-8 box table (Rank, IP Address, Response Time,
// Location). Results are shown in the given order.
std::string FormatResultsTable(const std::vector<verify::ProxyResult>& results);

}  // namespace app
}  // namespace proxyscan

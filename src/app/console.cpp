// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/console.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace proxyscan {
namespace app {

namespace {

constexpr std::array<const char*, 10> kSpinnerFrames = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

constexpr const char* kClearLine = "\r\033[2K";
constexpr const char* kReset = "\033[0m";
constexpr const char* kBoldCyan = "\033[1;36m";
constexpr const char* kBoldGreen = "\033[1;32m";
constexpr const char* kBoldBlue = "\033[1;34m";
constexpr const char* kBoldRed = "\033[1;31m";
constexpr const char* kBoldYellow = "\033[1;33m";

std::string FormatElapsed(std::chrono::steady_clock::duration elapsed) {
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  std::ostringstream out;
  out << std::setfill('0') << std::setw(2) << secs / 3600 << ":" << std::setw(2) << (secs / 60) % 60 << ":"
      << std::setw(2) << secs % 60;
  return out.str();
}

// Number of code points; close enough to terminal width for table cells
size_t DisplayWidth(const std::string& s) {
  return static_cast<size_t>(
      std::count_if(s.begin(), s.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

std::string Repeat(const std::string& s, size_t n) {
  std::string out;
  out.reserve(s.size() * n);
  for (size_t i = 0; i < n; ++i) {
    out += s;
  }
  return out;
}

}  // namespace

ConsoleReporter::ConsoleReporter(asio::io_context& io_context, std::ostream& out, bool verbose, bool interactive)
    : timer_(io_context), out_(out), verbose_(verbose), interactive_(interactive) {}

void ConsoleReporter::BeginProgress(std::optional<uint64_t> total, std::string message) {
  total_ = total;
  message_ = std::move(message);
  position_ = 0;
  found_ = 0;
  started_ = std::chrono::steady_clock::now();
  active_ = true;

  if (interactive_) {
    Redraw();
    ScheduleTick();
  }
}

void ConsoleReporter::ScheduleTick() {
  timer_.expires_after(TICK_INTERVAL);
  timer_.async_wait([this](const asio::error_code& ec) {
    if (ec || !active_) {
      return;
    }
    spinner_frame_ = (spinner_frame_ + 1) % kSpinnerFrames.size();
    Redraw();
    ScheduleTick();
  });
}

std::string ConsoleReporter::ProgressLine() const {
  std::ostringstream line;
  line << kSpinnerFrames[spinner_frame_] << " ";
  if (total_) {
    const uint64_t total = *total_;
    const uint64_t pos = std::min(position_, total);
    const size_t filled = total == 0 ? BAR_WIDTH : static_cast<size_t>(pos * BAR_WIDTH / total);
    const uint64_t percent = total == 0 ? 100 : pos * 100 / total;
    line << "[" << FormatElapsed(std::chrono::steady_clock::now() - started_) << "] [" << std::string(filled, '#')
         << std::string(BAR_WIDTH - filled, '-') << "] " << pos << "/" << total << " (" << percent << "%)";
  } else {
    line << message_ << " (" << found_ << " found, " << position_ << " tested)";
  }
  return line.str();
}

void ConsoleReporter::Redraw() {
  if (!interactive_ || !active_) {
    return;
  }
  out_ << kClearLine << ProgressLine() << std::flush;
}

void ConsoleReporter::PrintEvent(const std::string& tag, const char* color, const std::string& text) {
  if (interactive_ && active_) {
    out_ << kClearLine;
  }
  std::string label = "[" + tag + "]";
  std::string padding(label.size() < 10 ? 10 - label.size() : 1, ' ');
  if (interactive_) {
    out_ << color << label << kReset;
  } else {
    out_ << label;
  }
  out_ << padding << text << "\n";
  Redraw();
  out_ << std::flush;
}

void ConsoleReporter::OnCandidate(const scan::Candidate& candidate) {
  found_++;
  if (verbose_) {
    PrintEvent("FOUND", kBoldCyan, "Potential proxy at " + candidate.ToString());
  }
}

void ConsoleReporter::OnSuccess(const scan::Candidate&, const verify::ProxyResult& result) {
  position_++;
  if (verbose_) {
    const std::string ip = result.address.to_string();
    PrintEvent("SUCCESS", kBoldGreen, ip + " connected in " + std::to_string(result.response_time_ms) + "ms");
    PrintEvent("GEO", kBoldBlue, ip + " located in " + result.location);
  }
}

void ConsoleReporter::OnFailure(const scan::Candidate& candidate, const std::string& reason) {
  position_++;
  if (verbose_) {
    PrintEvent("FAIL", kBoldRed, candidate.ToString() + ": " + reason);
  }
}

void ConsoleReporter::OnFault(const scan::Candidate& candidate, const std::string& reason) {
  position_++;
  PrintEvent("ERROR", kBoldYellow, "A test task failed for " + candidate.ToString() + ": " + reason);
}

void ConsoleReporter::OnFinished(const scan::PipelineStats&) {
  if (!active_) {
    return;
  }
  timer_.cancel();
  if (interactive_) {
    out_ << kClearLine << ProgressLine() << " All tasks completed!\n" << std::flush;
  }
  active_ = false;
}

std::string FormatResultsTable(const std::vector<verify::ProxyResult>& results) {
  const std::array<std::string, 4> header = {"Rank", "IP Address", "Response Time", "Location"};

  std::vector<std::array<std::string, 4>> rows;
  rows.reserve(results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    rows.push_back({std::to_string(i + 1), results[i].address.to_string(),
                    std::to_string(results[i].response_time_ms) + " ms", results[i].location});
  }

  std::array<size_t, 4> widths{};
  for (size_t c = 0; c < 4; ++c) {
    widths[c] = DisplayWidth(header[c]);
    for (const auto& row : rows) {
      widths[c] = std::max(widths[c], DisplayWidth(row[c]));
    }
  }

  auto rule = [&](const char* left, const char* fill, const char* mid, const char* right) {
    std::string line = left;
    for (size_t c = 0; c < 4; ++c) {
      line += Repeat(fill, widths[c] + 2);
      line += c + 1 < 4 ? mid : right;
    }
    return line + "\n";
  };
  auto row_line = [&](const std::array<std::string, 4>& cells) {
    std::string line = "│";
    for (size_t c = 0; c < 4; ++c) {
      line += " " + cells[c] + std::string(widths[c] - DisplayWidth(cells[c]), ' ') + " ";
      line += c + 1 < 4 ? "┆" : "│";
    }
    return line + "\n";
  };

  std::string table = rule("┌", "─", "┬", "┐");
  table += row_line(header);
  table += rule("╞", "═", "╪", "╡");
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0) {
      table += rule("├", "╌", "┼", "┤");
    }
    table += row_line(rows[i]);
  }
  table += rule("└", "─", "┴", "┘");
  return table;
}

}  // namespace app
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/candidate_file_reader.hpp"

#include "scan/candidate_channel.hpp"
#include "util/csv.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>

namespace proxyscan {
namespace scan {

namespace {

bool IsBlankRecord(const std::vector<std::string>& fields) {
  return std::all_of(fields.begin(), fields.end(), [](const std::string& f) { return util::Trim(f).empty(); });
}

}  // namespace

CandidateFileReader::CandidateFileReader(std::filesystem::path path, uint16_t default_port)
    : path_(std::move(path)), default_port_(default_port) {}

void CandidateFileReader::ForEachCandidate(const std::function<bool(Candidate)>& fn) const {
  std::ifstream file(path_, std::ios::binary);
  if (!file.is_open()) {
    throw SourceError("cannot open input file '" + path_.string() + "': " + std::strerror(errno));
  }

  util::CsvReader reader(file);
  std::vector<std::string> fields;

  try {
    if (!reader.ReadRecord(fields)) {
      LOG_SCAN_INFO("CandidateFileReader: {} is empty", path_.string());
      return;
    }

    const size_t column_count = fields.size();
    size_t ip_column = column_count;
    for (size_t i = 0; i < column_count; ++i) {
      if (util::Trim(fields[i]) == IP_ADDRESS_COLUMN) {
        ip_column = i;
        break;
      }
    }

    size_t records = 0;
    size_t skipped = 0;
    while (reader.ReadRecord(fields)) {
      if (ip_column == column_count) {
        throw SourceError(path_.string() + ": missing \"" + IP_ADDRESS_COLUMN + "\" column in header");
      }
      if (IsBlankRecord(fields)) {
        continue;
      }
      if (fields.size() != column_count) {
        throw SourceError(path_.string() + ":" + std::to_string(reader.record_line()) + ": found record with " +
                          std::to_string(fields.size()) + " fields, but the header has " +
                          std::to_string(column_count));
      }

      records++;
      auto candidate = ParseCandidate(fields[ip_column], default_port_);
      if (!candidate) {
        skipped++;
        LOG_SCAN_DEBUG("CandidateFileReader: {}:{}: skipping unparseable address '{}'", path_.string(),
                       reader.record_line(), fields[ip_column]);
        continue;
      }
      if (!fn(std::move(*candidate))) {
        return;
      }
    }

    LOG_SCAN_DEBUG("CandidateFileReader: {} has {} records, {} skipped", path_.string(), records, skipped);
  } catch (const util::CsvError& e) {
    throw SourceError(path_.string() + ":" + std::to_string(e.line()) + ": " + e.what());
  }

  if (file.bad()) {
    throw SourceError("error reading input file '" + path_.string() + "'");
  }
}

uint64_t CandidateFileReader::CountCandidates() {
  uint64_t count = 0;
  ForEachCandidate([&count](Candidate) {
    count++;
    return true;
  });
  expected_count_ = count;
  return count;
}

std::vector<Candidate> CandidateFileReader::ReadAll() const {
  std::vector<Candidate> candidates;
  ForEachCandidate([&candidates](Candidate candidate) {
    candidates.push_back(std::move(candidate));
    return true;
  });
  return candidates;
}

void CandidateFileReader::Produce(CandidateChannel& channel) {
  uint64_t sent = 0;
  ForEachCandidate([&](Candidate candidate) {
    if (!channel.Send(std::move(candidate))) {
      return false;
    }
    sent++;
    return true;
  });
  LOG_SCAN_INFO("CandidateFileReader: queued {} candidates from {}", sent, path_.string());
}

}  // namespace scan
}  // namespace proxyscan

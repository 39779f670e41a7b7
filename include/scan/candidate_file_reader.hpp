// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/address_source.hpp"
#include "scan/candidate.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace proxyscan {
namespace scan {

// Column that carries the candidate address in input files and reports
static constexpr const char* IP_ADDRESS_COLUMN = "IP Address";

// CandidateFileReader - file-mode address source.
//
// Reads a CSV file with a header row; the "IP Address" column holds "IP",
// "IP:port" or "[IPv6]:port". Other columns are ignored, so a previous
// report can be fed back in. Candidates are emitted in file order;
// duplicates are kept. Records whose address does not parse are skipped.
//
// Structural problems (unreadable file, missing "IP Address" column,
// wrong field count, unterminated quote) throw SourceError.
class CandidateFileReader : public AddressSource {
public:
  CandidateFileReader(std::filesystem::path path, uint16_t default_port = DEFAULT_PROXY_PORT);

  // Parse the whole file once and remember the number of candidates for
  // ExpectedCount(). Throws SourceError.
  uint64_t CountCandidates();

  // Parse the whole file. Throws SourceError.
  std::vector<Candidate> ReadAll() const;

  void Produce(CandidateChannel& channel) override;

  std::optional<uint64_t> ExpectedCount() const override { return expected_count_; }

  const std::filesystem::path& path() const { return path_; }

private:
  // Calls fn for each candidate in file order until fn returns false
  void ForEachCandidate(const std::function<bool(Candidate)>& fn) const;

  std::filesystem::path path_;
  uint16_t default_port_;
  std::optional<uint64_t> expected_count_;
};

}  // namespace scan
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/address_source.hpp"
#include "scan/candidate_channel.hpp"
#include "scan/pipeline_observer.hpp"
#include "verify/proxy_verifier.hpp"

#include <optional>
#include <string>
#include <vector>

#include <asio/io_context.hpp>

namespace proxyscan {
namespace scan {

struct ScanReport {
  std::vector<verify::ProxyResult> results;  // ascending response_time_ms
  PipelineStats stats;
  // Set if the source stopped with an error (e.g. malformed input file).
  // Candidates produced before the error were still verified.
  std::optional<std::string> source_error;
};

// ScanPipeline - source -> channel -> verifiers -> aggregator.
//
// Run() starts the source on a producer thread, drives the aggregator and
// all verification units on the calling thread (io_context.run()), and
// returns once the source is exhausted and every unit has completed.
// The verifier must be bound to the same io_context.
class ScanPipeline {
public:
  ScanPipeline(AddressSource& source, verify::ProxyVerifier& verifier, asio::io_context& io_context,
               size_t queue_capacity = CandidateChannel::DEFAULT_CAPACITY, PipelineObserver* observer = nullptr);

  ScanReport Run();

private:
  AddressSource& source_;
  verify::ProxyVerifier& verifier_;
  asio::io_context& io_context_;
  size_t queue_capacity_;
  PipelineObserver* observer_;
};

}  // namespace scan
}  // namespace proxyscan

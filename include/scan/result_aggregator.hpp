// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate_channel.hpp"
#include "scan/pipeline_observer.hpp"
#include "verify/proxy_verifier.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace proxyscan {
namespace scan {

// ResultAggregator - consumer side of the pipeline.
//
// Runs entirely on one single-threaded io_context. Each candidate received
// from the channel immediately gets its own verification unit; the next
// receive is issued right away, so new candidates and finished units are
// handled in whatever order they become ready.
//
// Every unit ends in exactly one bucket:
// - success: appended to the result set
// - failure: counted and reported, then discarded
// - fault:   the verifier threw, or dropped the callback without calling it
//
// Once the channel is closed and drained and no unit is outstanding, the
// result set is stable-sorted by response time, OnFinished() fires and the
// io_context is released (run() returns when nothing else is pending).
class ResultAggregator {
public:
  ResultAggregator(asio::io_context& io_context, CandidateChannel& channel, verify::ProxyVerifier& verifier,
                   PipelineObserver* observer = nullptr);
  ~ResultAggregator();

  ResultAggregator(const ResultAggregator&) = delete;
  ResultAggregator& operator=(const ResultAggregator&) = delete;

  // Issue the first receive. Call once, before running the io_context.
  void Start();

  bool finished() const { return finished_; }
  size_t outstanding() const { return outstanding_; }
  const PipelineStats& stats() const { return stats_; }

  // Sorted ascending by response_time_ms once finished()
  const std::vector<verify::ProxyResult>& results() const { return results_; }
  std::vector<verify::ProxyResult> TakeResults() { return std::move(results_); }

private:
  class UnitGuard;

  void ReceiveNext();
  void HandleCandidate(std::optional<Candidate> candidate);
  void Spawn(const Candidate& candidate);
  void HandleOutcome(verify::VerificationOutcome outcome);
  void HandleFault(const Candidate& candidate, const std::string& reason);
  void MaybeFinish();

  asio::io_context& io_context_;
  CandidateChannel& channel_;
  verify::ProxyVerifier& verifier_;
  PipelineObserver* observer_;

  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  // Handlers that outlive the aggregator check this before touching it
  std::shared_ptr<ResultAggregator*> alive_;

  std::vector<verify::ProxyResult> results_;
  PipelineStats stats_;
  size_t outstanding_{0};
  bool source_done_{false};
  bool finished_{false};
};

}  // namespace scan
}  // namespace proxyscan

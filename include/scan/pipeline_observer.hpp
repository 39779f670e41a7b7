// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate.hpp"
#include "verify/verification.hpp"

#include <cstdint>
#include <string>

namespace proxyscan {
namespace scan {

struct PipelineStats {
  uint64_t candidates{0};  // received from the channel (= verification units spawned)
  uint64_t successes{0};
  uint64_t failures{0};    // verification failures (proxy did not work)
  uint64_t faults{0};      // execution faults (unit did not run to completion)

  uint64_t completed() const { return successes + failures + faults; }
};

// Pipeline events. All callbacks run on the pipeline's io_context thread,
// so implementations need no locking of their own.
class PipelineObserver {
public:
  virtual ~PipelineObserver() = default;

  // A candidate was taken off the channel and a verification unit spawned
  virtual void OnCandidate(const Candidate&) {}

  virtual void OnSuccess(const Candidate&, const verify::ProxyResult&) {}
  virtual void OnFailure(const Candidate&, const std::string& /*reason*/) {}
  virtual void OnFault(const Candidate&, const std::string& /*reason*/) {}

  // Source exhausted and every unit accounted for
  virtual void OnFinished(const PipelineStats&) {}
};

}  // namespace scan
}  // namespace proxyscan

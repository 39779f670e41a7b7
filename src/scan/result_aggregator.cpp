// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/result_aggregator.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

#include <asio/post.hpp>

namespace proxyscan {
namespace scan {

// Shared by every copy of one unit's completion callback. The first
// completion wins; if the last copy goes away without any completion the
// unit is reported as a fault.
class ResultAggregator::UnitGuard {
public:
  UnitGuard(asio::io_context& io_context, std::weak_ptr<ResultAggregator*> aggregator, Candidate candidate)
      : io_context_(io_context), aggregator_(std::move(aggregator)), candidate_(std::move(candidate)) {}

  ~UnitGuard() {
    if (completed_.load()) {
      return;
    }
    auto aggregator = aggregator_;
    if (aggregator.expired()) {
      return;
    }
    asio::post(io_context_, [aggregator, candidate = candidate_]() {
      if (auto self = aggregator.lock()) {
        (*self)->HandleFault(candidate, "verification unit dropped without producing an outcome");
      }
    });
  }

  UnitGuard(const UnitGuard&) = delete;
  UnitGuard& operator=(const UnitGuard&) = delete;

  // Returns true for the first caller only
  bool TryComplete() { return !completed_.exchange(true); }

  const Candidate& candidate() const { return candidate_; }

private:
  asio::io_context& io_context_;
  std::weak_ptr<ResultAggregator*> aggregator_;
  Candidate candidate_;
  std::atomic<bool> completed_{false};
};

ResultAggregator::ResultAggregator(asio::io_context& io_context, CandidateChannel& channel,
                                   verify::ProxyVerifier& verifier, PipelineObserver* observer)
    : io_context_(io_context),
      channel_(channel),
      verifier_(verifier),
      observer_(observer),
      alive_(std::make_shared<ResultAggregator*>(this)) {}

ResultAggregator::~ResultAggregator() = default;

void ResultAggregator::Start() {
  work_guard_.emplace(asio::make_work_guard(io_context_));
  ReceiveNext();
}

void ResultAggregator::ReceiveNext() {
  std::weak_ptr<ResultAggregator*> weak = alive_;
  channel_.AsyncReceive([weak](std::optional<Candidate> candidate) {
    if (auto self = weak.lock()) {
      (*self)->HandleCandidate(std::move(candidate));
    }
  });
}

void ResultAggregator::HandleCandidate(std::optional<Candidate> candidate) {
  if (!candidate) {
    LOG_SCAN_DEBUG("ResultAggregator: candidate source exhausted after {} candidates, {} units outstanding",
                   stats_.candidates, outstanding_);
    source_done_ = true;
    MaybeFinish();
    return;
  }

  stats_.candidates++;
  if (observer_) {
    observer_->OnCandidate(*candidate);
  }
  Spawn(*candidate);
  ReceiveNext();
}

void ResultAggregator::Spawn(const Candidate& candidate) {
  outstanding_++;

  auto guard = std::make_shared<UnitGuard>(io_context_, alive_, candidate);
  std::weak_ptr<ResultAggregator*> weak = alive_;
  asio::io_context& io = io_context_;

  // May be invoked from any thread; the outcome is always handed back
  // through the io_context
  verify::ProxyVerifier::VerifyCallback callback = [guard, weak, &io](verify::VerificationOutcome outcome) {
    if (!guard->TryComplete()) {
      LOG_SCAN_DEBUG("ResultAggregator: ignoring repeated completion for {}", guard->candidate().ToString());
      return;
    }
    asio::post(io, [weak, outcome = std::move(outcome)]() mutable {
      if (auto self = weak.lock()) {
        (*self)->HandleOutcome(std::move(outcome));
      }
    });
  };

  try {
    verifier_.Verify(candidate, std::move(callback));
  } catch (const std::exception& e) {
    if (guard->TryComplete()) {
      HandleFault(candidate, std::string("verification unit threw: ") + e.what());
    } else {
      LOG_SCAN_DEBUG("ResultAggregator: verifier threw after completing {}: {}", candidate.ToString(), e.what());
    }
  }
}

void ResultAggregator::HandleOutcome(verify::VerificationOutcome outcome) {
  outstanding_--;

  if (outcome.ok()) {
    stats_.successes++;
    if (observer_) {
      observer_->OnSuccess(outcome.endpoint, *outcome.result);
    }
    results_.push_back(std::move(*outcome.result));
  } else {
    stats_.failures++;
    if (observer_) {
      observer_->OnFailure(outcome.endpoint, outcome.error);
    }
  }

  MaybeFinish();
}

void ResultAggregator::HandleFault(const Candidate& candidate, const std::string& reason) {
  outstanding_--;
  stats_.faults++;
  LOG_WARN("execution fault while verifying {}: {}", candidate.ToString(), reason);
  if (observer_) {
    observer_->OnFault(candidate, reason);
  }
  MaybeFinish();
}

void ResultAggregator::MaybeFinish() {
  if (finished_ || !source_done_ || outstanding_ > 0) {
    return;
  }
  finished_ = true;

  std::stable_sort(results_.begin(), results_.end(), [](const verify::ProxyResult& a, const verify::ProxyResult& b) {
    return a.response_time_ms < b.response_time_ms;
  });

  LOG_SCAN_INFO("ResultAggregator: {} candidates, {} working, {} failed, {} faults", stats_.candidates,
                stats_.successes, stats_.failures, stats_.faults);

  if (observer_) {
    observer_->OnFinished(stats_);
  }
  work_guard_.reset();
}

}  // namespace scan
}  // namespace proxyscan

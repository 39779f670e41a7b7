// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate.hpp"
#include "verify/verification.hpp"

#include <functional>

namespace proxyscan {
namespace verify {

// ProxyVerifier - one verification unit per call.
//
// Verify() starts an asynchronous check of a single candidate and returns
// immediately. The callback is invoked exactly once, on the io_context the
// verifier was built on, with the outcome. Calls are independent: any number
// may be in flight at once.
class ProxyVerifier {
public:
  using VerifyCallback = std::function<void(VerificationOutcome)>;

  virtual ~ProxyVerifier() = default;

  virtual void Verify(const scan::Candidate& candidate, VerifyCallback callback) = 0;
};

}  // namespace verify
}  // namespace proxyscan

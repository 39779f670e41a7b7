// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <asio/ip/address.hpp>

namespace proxyscan {
namespace verify {

// A candidate that forwarded the geolocation request successfully
struct ProxyResult {
  asio::ip::address address;
  uint64_t response_time_ms{0};
  std::string location;  // "City, Country"; missing parts are "Unknown"
};

// Result of one verification attempt. Exactly one of result / error is
// meaningful: ok() outcomes carry a ProxyResult, the others a reason.
struct VerificationOutcome {
  scan::Candidate endpoint;
  std::optional<ProxyResult> result;
  std::string error;

  bool ok() const { return result.has_value(); }

  static VerificationOutcome Success(const scan::Candidate& endpoint, ProxyResult result) {
    return VerificationOutcome{endpoint, std::move(result), {}};
  }
  static VerificationOutcome Failure(const scan::Candidate& endpoint, std::string error) {
    return VerificationOutcome{endpoint, std::nullopt, std::move(error)};
  }
};

// Turn a geolocation service reply into an outcome.
//
// body is a JSON object with "status" (required string) and optional
// "city", "country" and "message" strings (null is the same as absent).
// status "success" yields a Success with location "{city}, {country}";
// any other status yields "Geo API error: {message}" ("API error" when the
// service gave no message). A body that is not such an object yields
// "error decoding response body: ...".
VerificationOutcome EvaluateGeoResponse(const scan::Candidate& endpoint, std::chrono::milliseconds elapsed,
                                        const std::string& body);

}  // namespace verify
}  // namespace proxyscan

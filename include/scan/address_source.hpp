// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>

namespace proxyscan {
namespace scan {

class CandidateChannel;

// Raised by a source whose input cannot be used at all (file missing,
// structurally malformed CSV). Individual bad records are not errors.
class SourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// AddressSource - producer side of the pipeline.
//
// Produce() runs on the pipeline's producer thread and blocks until the
// source is exhausted. It must not close the channel; the pipeline does
// that once Produce() returns or throws. If channel.Send() returns false
// the channel was closed underneath the source and Produce() should stop.
class AddressSource {
public:
  virtual ~AddressSource() = default;

  virtual void Produce(CandidateChannel& channel) = 0;

  // Number of candidates Produce() will emit, when known up front.
  // Used to choose between a progress bar and a spinner.
  virtual std::optional<uint64_t> ExpectedCount() const { return std::nullopt; }
};

}  // namespace scan
}  // namespace proxyscan

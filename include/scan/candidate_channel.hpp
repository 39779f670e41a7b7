// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/candidate.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

#include <asio/io_context.hpp>

namespace proxyscan {
namespace scan {

// CandidateChannel - bounded FIFO handoff between the address source and
// the result aggregator.
//
// Producer side (any thread, any number of producers): Send() blocks while
// the queue is at capacity, which is the backpressure that keeps discovery
// from running arbitrarily far ahead of verification.
//
// Consumer side (single consumer on the io_context): AsyncReceive() never
// blocks. The handler is posted to the io_context with the next candidate,
// or with std::nullopt once the channel is closed and drained. At most one
// receive may be outstanding.
class CandidateChannel {
public:
  using ReceiveHandler = std::function<void(std::optional<Candidate>)>;

  static constexpr size_t DEFAULT_CAPACITY = 200;

  CandidateChannel(asio::io_context& io_context, size_t capacity = DEFAULT_CAPACITY);

  CandidateChannel(const CandidateChannel&) = delete;
  CandidateChannel& operator=(const CandidateChannel&) = delete;

  // Blocks while full. Returns false (and drops the candidate) if the
  // channel is closed.
  bool Send(Candidate candidate);

  // Idempotent. Wakes blocked senders and completes a pending receive
  // once the queue is drained.
  void Close();

  void AsyncReceive(ReceiveHandler handler);

  size_t capacity() const { return capacity_; }
  size_t size() const;
  bool is_closed() const;

private:
  asio::io_context& io_context_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable not_full_cv_;
  std::deque<Candidate> queue_;
  ReceiveHandler pending_receive_;  // set only while queue_ is empty
  bool closed_{false};
};

}  // namespace scan
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/candidate_channel.hpp"

#include <utility>

#include <asio/post.hpp>

namespace proxyscan {
namespace scan {

CandidateChannel::CandidateChannel(asio::io_context& io_context, size_t capacity)
    : io_context_(io_context), capacity_(capacity == 0 ? 1 : capacity) {}

bool CandidateChannel::Send(Candidate candidate) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_cv_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
  if (closed_) {
    return false;
  }

  if (pending_receive_) {
    // Consumer is parked on an empty queue: hand over directly. FIFO holds
    // because a receive is only parked while nothing is queued.
    auto handler = std::move(pending_receive_);
    pending_receive_ = nullptr;
    lock.unlock();
    asio::post(io_context_, [handler = std::move(handler), candidate = std::move(candidate)]() mutable {
      handler(std::move(candidate));
    });
    return true;
  }

  queue_.push_back(std::move(candidate));
  return true;
}

void CandidateChannel::Close() {
  ReceiveHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    handler = std::move(pending_receive_);
    pending_receive_ = nullptr;
  }
  not_full_cv_.notify_all();

  if (handler) {
    asio::post(io_context_, [handler = std::move(handler)]() { handler(std::nullopt); });
  }
}

void CandidateChannel::AsyncReceive(ReceiveHandler handler) {
  std::unique_lock<std::mutex> lock(mutex_);

  if (!queue_.empty()) {
    Candidate next = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_cv_.notify_one();
    asio::post(io_context_, [handler = std::move(handler), next = std::move(next)]() mutable {
      handler(std::move(next));
    });
    return;
  }

  if (closed_) {
    lock.unlock();
    asio::post(io_context_, [handler = std::move(handler)]() { handler(std::nullopt); });
    return;
  }

  pending_receive_ = std::move(handler);
}

size_t CandidateChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool CandidateChannel::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace scan
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/range_scanner.hpp"

#include "scan/candidate_channel.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <asio/connect.hpp>
#include <asio/steady_timer.hpp>

namespace proxyscan {
namespace scan {

bool ProbeTcp(asio::io_context& io, const asio::ip::tcp::endpoint& endpoint, std::chrono::milliseconds timeout) {
  asio::ip::tcp::socket socket(io);
  asio::steady_timer deadline(io, timeout);

  bool completed = false;
  asio::error_code result = asio::error::timed_out;

  deadline.async_wait([&](const asio::error_code& ec) {
    if (!ec && !completed) {
      // Aborts the pending connect; its handler sees operation_aborted
      asio::error_code ignored;
      socket.close(ignored);
    }
  });

  socket.async_connect(endpoint, [&](const asio::error_code& ec) {
    completed = true;
    result = ec;
    deadline.cancel();
  });

  io.restart();
  io.run();

  if (result == asio::error::no_descriptors) {
    LOG_SCAN_WARN("ProbeTcp: out of file descriptors while probing {}", endpoint.address().to_string());
  } else if (result) {
    LOG_SCAN_TRACE("ProbeTcp: {} unreachable: {}", endpoint.address().to_string(),
                   result == asio::error::operation_aborted ? "timed out" : result.message());
  }

  asio::error_code ignored;
  socket.close(ignored);
  return !result;
}

RangeScanner::RangeScanner(std::string range, uint16_t port, std::chrono::milliseconds connect_timeout,
                           size_t workers)
    : range_(std::move(range)), port_(port), connect_timeout_(connect_timeout), workers_(workers) {}

void RangeScanner::Produce(CandidateChannel& channel) {
  probed_.store(0, std::memory_order_relaxed);
  found_.store(0, std::memory_order_relaxed);

  auto network = util::IPNetwork::Parse(range_);
  if (!network) {
    LOG_SCAN_DEBUG("RangeScanner: cannot parse range '{}', nothing to scan", range_);
    return;
  }

  const uint64_t total = network->host_count();
  size_t worker_count = workers_ != 0 ? workers_ : std::thread::hardware_concurrency();
  worker_count = std::max<size_t>(worker_count, 1);
  if (total < worker_count) {
    worker_count = static_cast<size_t>(std::max<uint64_t>(total, 1));
  }

  LOG_SCAN_INFO("RangeScanner: probing {} hosts in {} on port {} with {} workers ({} ms timeout)", total,
                network->ToString(), port_, worker_count, connect_timeout_.count());

  std::atomic<uint64_t> next_index{0};
  std::atomic<bool> stop{false};

  auto worker = [&]() {
    asio::io_context io;
    while (!stop.load(std::memory_order_relaxed)) {
      const uint64_t index = next_index.fetch_add(1, std::memory_order_relaxed);
      if (index >= total) {
        break;
      }

      Candidate candidate{network->host_at(index), port_};
      probed_.fetch_add(1, std::memory_order_relaxed);
      if (!ProbeTcp(io, candidate.endpoint(), connect_timeout_)) {
        continue;
      }

      found_.fetch_add(1, std::memory_order_relaxed);
      LOG_SCAN_DEBUG("RangeScanner: {} is accepting connections", candidate.ToString());
      if (!channel.Send(std::move(candidate))) {
        // Channel closed underneath us
        stop.store(true, std::memory_order_relaxed);
        break;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(worker_count);
  try {
    for (size_t i = 0; i < worker_count; ++i) {
      threads.emplace_back(worker);
    }
  } catch (const std::system_error& e) {
    LOG_SCAN_ERROR("RangeScanner: failed to start worker thread: {}", e.what());
    stop.store(true, std::memory_order_relaxed);
    for (auto& t : threads) {
      t.join();
    }
    throw;
  }

  for (auto& t : threads) {
    t.join();
  }

  LOG_SCAN_INFO("RangeScanner: finished {} ({} probed, {} open)", network->ToString(), probed(), found());
}

}  // namespace scan
}  // namespace proxyscan

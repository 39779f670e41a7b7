// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/address_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace proxyscan {
namespace scan {

static constexpr std::chrono::milliseconds DEFAULT_SCAN_TIMEOUT{200};

// Blocking TCP connect with a deadline, driven on a caller-owned io_context
// (one per worker thread). Returns true if the connection was established
// within timeout. The connection is closed immediately.
bool ProbeTcp(asio::io_context& io, const asio::ip::tcp::endpoint& endpoint, std::chrono::milliseconds timeout);

// RangeScanner - range-mode address source.
//
// Probes every usable host of a CIDR range for an open port and emits each
// responsive host as a candidate. Hosts are handed out to a pool of worker
// threads by index, so emission order is not related to address order.
// Unreachable hosts are dropped silently. An unparseable range produces no
// candidates and no error.
class RangeScanner : public AddressSource {
public:
  // workers == 0 uses std::thread::hardware_concurrency()
  RangeScanner(std::string range, uint16_t port, std::chrono::milliseconds connect_timeout = DEFAULT_SCAN_TIMEOUT,
               size_t workers = 0);

  void Produce(CandidateChannel& channel) override;

  // Hosts probed during the last Produce() call
  uint64_t probed() const { return probed_.load(std::memory_order_relaxed); }
  // Hosts that accepted a connection during the last Produce() call
  uint64_t found() const { return found_.load(std::memory_order_relaxed); }

private:
  std::string range_;
  uint16_t port_;
  std::chrono::milliseconds connect_timeout_;
  size_t workers_;

  std::atomic<uint64_t> probed_{0};
  std::atomic<uint64_t> found_{0};
};

}  // namespace scan
}  // namespace proxyscan

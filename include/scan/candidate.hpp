// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>

namespace proxyscan {
namespace scan {

// Default port for range scans and for input records without an explicit port
static constexpr uint16_t DEFAULT_PROXY_PORT = 7890;

// Candidate - an (address, port) pair to be tested as an HTTP proxy.
// Plain value type: copied into the channel, then moved into exactly one
// verification unit.
struct Candidate {
  asio::ip::address address;
  uint16_t port{0};

  asio::ip::tcp::endpoint endpoint() const { return asio::ip::tcp::endpoint(address, port); }

  // "1.2.3.4:7890" or "[2001:db8::1]:7890"
  std::string ToString() const;

  bool operator==(const Candidate& other) const = default;
};

// Parse the address field of an input record: "IP", "IP:port" or
// "[IPv6]:port". Surrounding whitespace is ignored and IPv4-mapped IPv6
// addresses are normalized to IPv4. Returns nullopt if the text is neither
// a valid address nor a valid address:port.
std::optional<Candidate> ParseCandidate(const std::string& text, uint16_t default_port);

}  // namespace scan
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/candidate.hpp"

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

namespace proxyscan {
namespace scan {

std::string Candidate::ToString() const {
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(port);
  }
  return address.to_string() + ":" + std::to_string(port);
}

std::optional<Candidate> ParseCandidate(const std::string& text, uint16_t default_port) {
  const std::string trimmed = util::Trim(text);

  std::string ip;
  uint16_t port = 0;
  if (util::ParseIPPort(trimmed, ip, port)) {
    auto address = util::ParseNormalizedAddress(ip);
    if (address) {
      return Candidate{*address, port};
    }
    return std::nullopt;
  }

  auto address = util::ParseNormalizedAddress(trimmed);
  if (address) {
    return Candidate{*address, default_port};
  }
  return std::nullopt;
}

}  // namespace scan
}  // namespace proxyscan

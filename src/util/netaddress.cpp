#include "util/netaddress.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <array>

namespace proxyscan {
namespace util {

std::optional<asio::ip::address> ParseNormalizedAddress(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      return asio::ip::address(asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()));
    }
    return ip;

  } catch (const std::exception& e) {
    LOG_TRACE("ParseNormalizedAddress: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  auto ip = ParseNormalizedAddress(address);
  if (!ip) {
    return std::nullopt;
  }
  return ip->to_string();
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip_part;
  std::string port_str;

  if (address_port[0] == '[') {
    // "[IPv6]:port"
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;  // Missing closing bracket or empty brackets
    }
    if (bracket_end + 1 >= address_port.length() || address_port[bracket_end + 1] != ':') {
      return false;  // Missing :port
    }
    ip_part = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    // "IPv4:port" - multiple colons means unbracketed IPv6, which is ambiguous
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false;
    }
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip_part = address_port.substr(0, first_colon);
    port_str = address_port.substr(first_colon + 1);
  }

  // Port 0 is accepted here; such a candidate fails at connect time
  auto port = SafeParseInt64(port_str, 0, 65535);
  if (!port) {
    return false;
  }

  auto normalized = ValidateAndNormalizeIP(ip_part);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = static_cast<uint16_t>(*port);
  return true;
}

// ============================================================================
// IPNetwork
// ============================================================================

namespace {

asio::ip::address_v6 AddToV6(const asio::ip::address_v6& base, uint64_t offset) {
  auto bytes = base.to_bytes();
  unsigned carry = 0;
  for (int i = 15; i >= 0; --i) {
    unsigned sum = static_cast<unsigned>(bytes[i]) + static_cast<unsigned>(offset & 0xff) + carry;
    bytes[i] = static_cast<unsigned char>(sum & 0xff);
    carry = sum >> 8;
    offset >>= 8;
    if (offset == 0 && carry == 0) {
      break;
    }
  }
  return asio::ip::address_v6(bytes);
}

}  // namespace

IPNetwork::IPNetwork(asio::ip::address network, unsigned prefix_length)
    : network_(network), prefix_length_(prefix_length) {
  if (network_.is_v4()) {
    unsigned host_bits = 32 - prefix_length_;
    uint64_t total = uint64_t{1} << host_bits;
    if (prefix_length_ >= 31) {
      first_host_offset_ = 0;
      host_count_ = total;
    } else {
      first_host_offset_ = 1;
      host_count_ = total - 2;
    }
  } else {
    unsigned host_bits = 128 - prefix_length_;
    uint64_t total = uint64_t{1} << host_bits;  // host_bits <= 32, enforced by Parse
    if (prefix_length_ >= 127) {
      first_host_offset_ = 0;
      host_count_ = total;
    } else {
      first_host_offset_ = 1;
      host_count_ = total - 1;
    }
  }
}

std::optional<IPNetwork> IPNetwork::Parse(const std::string& cidr) {
  size_t slash = cidr.find('/');
  if (slash == std::string::npos || slash == 0) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto addr = asio::ip::make_address(cidr.substr(0, slash), ec);
  if (ec) {
    return std::nullopt;
  }

  const int max_prefix = addr.is_v4() ? 32 : 128;
  auto prefix = SafeParseInt(cidr.substr(slash + 1), 0, max_prefix);
  if (!prefix) {
    return std::nullopt;
  }

  if (addr.is_v4()) {
    uint32_t mask = *prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - *prefix));
    asio::ip::address_v4 network(addr.to_v4().to_uint() & mask);
    return IPNetwork(asio::ip::address(network), static_cast<unsigned>(*prefix));
  }

  if (static_cast<uint64_t>(128 - *prefix) > 32) {
    LOG_SCAN_DEBUG("IPNetwork: refusing {} ({} host bits exceeds limit of 32)", cidr, 128 - *prefix);
    return std::nullopt;
  }

  auto bytes = addr.to_v6().to_bytes();
  for (int i = 0; i < 16; ++i) {
    int bits_left = *prefix - i * 8;
    if (bits_left >= 8) {
      continue;
    }
    if (bits_left <= 0) {
      bytes[i] = 0;
    } else {
      bytes[i] &= static_cast<unsigned char>(0xFF << (8 - bits_left));
    }
  }
  return IPNetwork(asio::ip::address(asio::ip::address_v6(bytes)), static_cast<unsigned>(*prefix));
}

asio::ip::address IPNetwork::host_at(uint64_t index) const {
  uint64_t offset = first_host_offset_ + index;
  if (network_.is_v4()) {
    return asio::ip::address_v4(network_.to_v4().to_uint() + static_cast<uint32_t>(offset));
  }
  return AddToV6(network_.to_v6(), offset);
}

std::string IPNetwork::ToString() const {
  return network_.to_string() + "/" + std::to_string(prefix_length_);
}

}  // namespace util
}  // namespace proxyscan

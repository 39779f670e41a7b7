#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings from candidate lists
 - Split "IP:port" / "[IPv6]:port" strings
 - Parse CIDR ranges and enumerate their usable host addresses

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseIPPort: Splits and validates an address with explicit port
 - IPNetwork: CIDR range with lazy, index-based host enumeration
*/

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/address.hpp>

namespace proxyscan {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address() and additionally:
 * 1. Rejects empty strings and hostnames (only numeric IPs accepted)
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 format (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation
 *
 * Normalization keeps "192.168.1.1" and "::ffff:192.168.1.1" from being
 * reported as two different proxies.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Same as ValidateAndNormalizeIP but returns the parsed address object
 */
std::optional<asio::ip::address> ParseNormalizedAddress(const std::string& address);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * Supports both IPv4 and IPv6 formats:
 * - IPv4: "192.168.1.1:7890"
 * - IPv6: "[2001:db8::1]:7890"
 *
 * Unbracketed IPv6 ("2001:db8::1:7890") is rejected as ambiguous.
 *
 * @param address_port String in "IP:port" or "[IPv6]:port" format
 * @param out_ip Output parameter for normalized IP address string
 * @param out_port Output parameter for port number (0-65535)
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

/**
 * IPNetwork - an IPv4 or IPv6 CIDR range
 *
 * Host addresses are enumerated by index so a range can be scanned without
 * materializing its host list:
 * - IPv4 /0../30: network and broadcast addresses are excluded
 * - IPv4 /31, /32: every address is a host
 * - IPv6 /96../126: the network (Subnet-Router anycast) address is excluded
 * - IPv6 /127, /128: every address is a host
 *
 * IPv6 prefixes shorter than /96 (more than 2^32 hosts) are rejected.
 */
class IPNetwork {
public:
  // Maximum number of host addresses a range may contain
  static constexpr uint64_t MAX_HOSTS = uint64_t{1} << 32;

  // Parse "address/prefix". Host bits in the address are masked off
  // ("10.0.0.7/30" -> 10.0.0.4/30). Returns nullopt on any error.
  static std::optional<IPNetwork> Parse(const std::string& cidr);

  const asio::ip::address& network() const { return network_; }
  unsigned prefix_length() const { return prefix_length_; }

  // Number of usable host addresses
  uint64_t host_count() const { return host_count_; }

  // index must be < host_count()
  asio::ip::address host_at(uint64_t index) const;

  std::string ToString() const;

private:
  IPNetwork(asio::ip::address network, unsigned prefix_length);

  asio::ip::address network_;
  unsigned prefix_length_;
  uint64_t first_host_offset_{0};
  uint64_t host_count_{0};
};

}  // namespace util
}  // namespace proxyscan

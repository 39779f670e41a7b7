// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <charconv>

namespace proxyscan {
namespace util {

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  if (str.empty()) {
    return std::nullopt;
  }

  // std::from_chars accepts a leading '-' but no '+' or whitespace, which is
  // what we want; only reject '-' when the range cannot be negative.
  if (str[0] == '-' && min >= 0) {
    return std::nullopt;
  }

  int64_t value = 0;
  const char* begin = str.data();
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value, 10);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::string Trim(const std::string& str) {
  size_t start = 0;
  while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
    start++;
  }
  size_t end = str.size();
  while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    end--;
  }
  return str.substr(start, end - start);
}

}  // namespace util
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace proxyscan {
namespace util {

// Strict integer parsing for user-supplied values (command line, input files).
// The whole string must be consumed: leading/trailing whitespace, signs on
// unsigned values and trailing garbage are all rejected.

// Parse a decimal integer in [min, max].
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// Parse a decimal 64-bit integer in [min, max].
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

// Parse a TCP port in [1, 65535].
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Strip ASCII whitespace from both ends.
std::string Trim(const std::string& str);

}  // namespace util
}  // namespace proxyscan

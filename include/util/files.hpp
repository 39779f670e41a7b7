// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace proxyscan {
namespace util {

// Write data to path atomically: temp file (O_EXCL | O_NOFOLLOW), fsync,
// directory fsync, rename. On failure the target is left untouched and the
// error is logged. Parent directories are created if missing.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);

// Same as above with mode 0644
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace proxyscan

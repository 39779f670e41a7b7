#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace proxyscan {
namespace util {

namespace {

bool sync_file(int fd) {
#if defined(__APPLE__)
  // macOS: fsync() doesn't guarantee data reaches physical disk.
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool result = fcntl(fd, F_FULLFSYNC, 0) == 0;
  close(fd);
  return result;
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
#endif
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to create parent directory: {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL: never reuse a pre-existing temp file. O_NOFOLLOW: never write through a symlink.
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: Failed to create temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: Failed to write to temp file {}: {} (errno={}, written {}/{})", temp_path.string(),
                std::strerror(errno), errno, total, data.size());
      close(fd);
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (!sync_file(fd)) {
    LOG_ERROR("atomic_write_file: Failed to fsync temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    close(fd);
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  close(fd);

  // A rename into a directory that cannot be synced is not durable
  auto sync_dir = parent.empty() ? std::filesystem::path(".") : parent;
  if (!sync_directory(sync_dir)) {
    LOG_ERROR("atomic_write_file: Failed to fsync parent directory {} for atomic write of {}: {} (errno={})",
              sync_dir.string(), path.string(), std::strerror(errno), errno);
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: Failed to rename {} to {}: {} (code={})", temp_path.string(), path.string(),
              ec.message(), ec.value());
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) {
    return true;
  }
  return std::filesystem::is_directory(dir, ec);
}

}  // namespace util
}  // namespace proxyscan

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace proxyscan {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Diagnostics are written to stderr (and optionally a file) and are
 * separate from the user-facing console output (progress, verbose
 * event lines, result table), which goes through app::ConsoleReporter.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Thread-safe: Uses std::call_once internally. Multiple calls are safe;
  // only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "proxyscan.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component ("scan", "verify", "app", "default").
  // Unknown components get the default logger.
  // Thread-safe: Protected by mutex. Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace proxyscan

// Convenience macros for logging
#define LOG_TRACE(...) proxyscan::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) proxyscan::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) proxyscan::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) proxyscan::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) proxyscan::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SCAN_TRACE(...) proxyscan::util::LogManager::GetLogger("scan")->trace(__VA_ARGS__)
#define LOG_SCAN_DEBUG(...) proxyscan::util::LogManager::GetLogger("scan")->debug(__VA_ARGS__)
#define LOG_SCAN_INFO(...) proxyscan::util::LogManager::GetLogger("scan")->info(__VA_ARGS__)
#define LOG_SCAN_WARN(...) proxyscan::util::LogManager::GetLogger("scan")->warn(__VA_ARGS__)
#define LOG_SCAN_ERROR(...) proxyscan::util::LogManager::GetLogger("scan")->error(__VA_ARGS__)

#define LOG_VERIFY_TRACE(...) proxyscan::util::LogManager::GetLogger("verify")->trace(__VA_ARGS__)
#define LOG_VERIFY_DEBUG(...) proxyscan::util::LogManager::GetLogger("verify")->debug(__VA_ARGS__)
#define LOG_VERIFY_INFO(...) proxyscan::util::LogManager::GetLogger("verify")->info(__VA_ARGS__)
#define LOG_VERIFY_WARN(...) proxyscan::util::LogManager::GetLogger("verify")->warn(__VA_ARGS__)
#define LOG_VERIFY_ERROR(...) proxyscan::util::LogManager::GetLogger("verify")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) proxyscan::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) proxyscan::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...) proxyscan::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

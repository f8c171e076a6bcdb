#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ghostlink::logging {

enum class LogLevel {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

// Installs the process-wide "ghostlink" logger.
// A console sink is attached when console is true; a file sink is attached when
// log_file is non-empty (parent directories are created on demand).
// Safe to call more than once; the latest call wins.
void configure_logging(LogLevel level, bool console, const std::string& log_file = {});

// Parse "trace", "debug", "info", "warn", "error" or "off". Unknown names map to info.
LogLevel parse_log_level(const std::string& name);

// Returns the configured logger, creating a console logger at info level on first use.
std::shared_ptr<spdlog::logger> logger();

}  // namespace ghostlink::logging

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::ghostlink::logging::logger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::ghostlink::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::ghostlink::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::ghostlink::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::ghostlink::logging::logger(), __VA_ARGS__)

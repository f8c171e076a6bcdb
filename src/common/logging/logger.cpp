#include "common/logging/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

namespace ghostlink::logging {

namespace {
constexpr const char* kLoggerName = "ghostlink";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex& logger_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> instance;
  return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}
}  // namespace

void configure_logging(LogLevel level, bool console, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!log_file.empty()) {
    const auto parent = std::filesystem::path(log_file).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& e) {
      // Fall back to whatever sinks are left; report on stderr so the failure is visible.
      if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
      }
      spdlog::logger tmp("ghostlink-setup", sinks.begin(), sinks.end());
      tmp.error("Failed to open log file {}: {}", log_file, e.what());
    }
  }

  auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  created->set_pattern(kPattern);
  created->set_level(to_spdlog(level));
  created->flush_on(spdlog::level::warn);

  std::lock_guard<std::mutex> lock(logger_mutex());
  logger_slot() = std::move(created);
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "trace") return LogLevel::trace;
  if (name == "debug") return LogLevel::debug;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "off") return LogLevel::off;
  return LogLevel::info;
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& slot = logger_slot();
  if (!slot) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    slot = std::make_shared<spdlog::logger>(kLoggerName, sink);
    slot->set_pattern(kPattern);
    slot->set_level(spdlog::level::info);
  }
  return slot;
}

}  // namespace ghostlink::logging

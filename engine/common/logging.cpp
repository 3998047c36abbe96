#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace pacer {
namespace engine {
namespace common {

namespace {
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v [%s:%#]";
}  // namespace

spdlog::level::level_enum ParseLogLevel(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void InitializeLogging(const ConfigManager& config) {
  std::string log_file_path = config.GetString("app.log.file", "logs/pacer.log");
  std::string log_level_str = config.GetString("app.log.level", "info");
  spdlog::level::level_enum level = ParseLogLevel(log_level_str);

  std::string path_str = log_file_path;
  try {
    std::filesystem::path p = std::filesystem::absolute(log_file_path);
    path_str = p.string();
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path());
    }

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_str, true);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    auto logger = std::make_shared<spdlog::logger>("pacer", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(kLogPattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[pacer] InitLogging failed (path=%s): %s\n", path_str.c_str(), e.what());
    auto logger = spdlog::get("pacer");
    if (!logger) {
      logger = spdlog::stdout_color_mt("pacer");
    }
    logger->set_pattern(kLogPattern);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
  }

  SPDLOG_INFO("Logging to {} with level {}", path_str, log_level_str);
}

}  // namespace common
}  // namespace engine
}  // namespace pacer

#pragma once

#include <spdlog/spdlog.h>

#include <string>

#include "config_manager.hpp"

namespace pacer {
namespace engine {
namespace common {

// Map "trace".."off" to an spdlog level, unknown strings yield info
spdlog::level::level_enum ParseLogLevel(const std::string& level);

// Build the default "pacer" logger from app.log.file / app.log.level:
// file sink plus colored stdout, console only if the file cannot be opened.
void InitializeLogging(const ConfigManager& config);

}  // namespace common
}  // namespace engine
}  // namespace pacer

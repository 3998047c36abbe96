#include "config_manager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace pacer {
namespace engine {
namespace common {

ConfigManager::ConfigManager() {
}

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    SPDLOG_WARN("Failed to open config file: {}", config_path);
    return false;
  }

  try {
    config_root_ = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    SPDLOG_WARN("Failed to parse config {}: {}", config_path, e.what());
    config_root_ = nlohmann::json();
    return false;
  }
  return AcceptRoot(config_path);
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  try {
    config_root_ = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    SPDLOG_WARN("Failed to parse inline config: {}", e.what());
    config_root_ = nlohmann::json();
    return false;
  }
  return AcceptRoot("<inline>");
}

bool ConfigManager::AcceptRoot(const std::string& source) {
  if (!config_root_.is_object()) {
    SPDLOG_WARN("Config {} loaded but root is not an object", source);
    config_root_ = nlohmann::json();
    return false;
  }

  SPDLOG_INFO("Loaded config from: {} (has {} top-level keys)", source, config_root_.size());
  std::string keys;
  for (auto it = config_root_.begin(); it != config_root_.end(); ++it) {
    if (!keys.empty()) keys += ", ";
    keys += it.key();
  }
  SPDLOG_TRACE("Config top-level keys: {}", keys);
  return true;
}

void ConfigManager::PrintAllConfig() const {
  SPDLOG_INFO("Active config:\n{}", config_root_.dump(2));
}

std::string ConfigManager::GetConfigDir() {
  const char* env = std::getenv("PACER_CONFIG_DIR");
  return env ? std::string(env) : "config";
}

bool ConfigManager::HasKey(const std::string& key) const {
  if (overrides_.find(key) != overrides_.end()) {
    return true;
  }
  return !GetNode(key).is_null();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    return it->second;
  }

  nlohmann::json node = GetNode(key);
  if (node.is_string()) {
    return node.get<std::string>();
  }
  SPDLOG_TRACE("GetString('{}'): not found, using default: {}", key, default_value);
  return default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetInt('{}'): bad override '{}': {}", key, it->second, e.what());
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number()) {
    return default_value;
  }
  return node.get<int>();
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetDouble('{}'): bad override '{}': {}", key, it->second, e.what());
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_number()) {
    return default_value;
  }
  return node.get<double>();
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    const std::string& val = it->second;
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    return default_value;
  }

  nlohmann::json node = GetNode(key);
  if (!node.is_boolean()) {
    return default_value;
  }
  return node.get<bool>();
}

nlohmann::json ConfigManager::GetNodeValue(const std::string& key) const {
  return GetNode(key);
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

void ConfigManager::SetInt(const std::string& key, int value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetDouble(const std::string& key, double value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetBool(const std::string& key, bool value) {
  overrides_[key] = value ? "true" : "false";
}

nlohmann::json ConfigManager::GetNode(const std::string& key) const {
  if (config_root_.is_null()) {
    return nlohmann::json();
  }

  // Dot notation: "limiter.groups.rest_public"
  std::vector<std::string> parts;
  std::string current;
  for (char c : key) {
    if (c == '.') {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }

  const nlohmann::json* node = &config_root_;
  for (const auto& part : parts) {
    if (!node->is_object() || !node->contains(part)) {
      SPDLOG_DEBUG("GetNode('{}'): key '{}' not found", key, part);
      return nlohmann::json();
    }
    node = &(*node)[part];
  }
  return *node;
}

}  // namespace common
}  // namespace engine
}  // namespace pacer

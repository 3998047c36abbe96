#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>

namespace pacer {
namespace engine {
namespace common {

// JSON-backed configuration with dotted-key lookup ("limiter.groups.websocket.rps")
// and string overrides that take precedence over the loaded document.
class ConfigManager {
 public:
  ConfigManager();
  ~ConfigManager() = default;

  // Load configuration from JSON file
  bool LoadFromFile(const std::string& config_path);

  // Load configuration from an in-memory JSON document
  bool LoadFromString(const std::string& json_text);

  // Print all config
  void PrintAllConfig() const;

  // Directory holding config files ($PACER_CONFIG_DIR, default "config")
  static std::string GetConfigDir();

  // True if the key resolves to a non-null node or has an override
  bool HasKey(const std::string& key) const;

  std::string GetString(const std::string& key, const std::string& default_value = "") const;
  int GetInt(const std::string& key, int default_value = 0) const;
  double GetDouble(const std::string& key, double default_value = 0.0) const;
  bool GetBool(const std::string& key, bool default_value = false) const;

  // Get any node (object, array, string, number, etc.), null if missing
  nlohmann::json GetNodeValue(const std::string& key) const;

  // Set value (for command-line overrides)
  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int value);
  void SetDouble(const std::string& key, double value);
  void SetBool(const std::string& key, bool value);

 private:
  bool AcceptRoot(const std::string& source);
  nlohmann::json GetNode(const std::string& key) const;

  nlohmann::json config_root_;
  std::unordered_map<std::string, std::string> overrides_;
};

}  // namespace common
}  // namespace engine
}  // namespace pacer

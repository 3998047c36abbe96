#pragma once

#include <stdexcept>
#include <string>

namespace pacer {

// Bad or missing limiter configuration (unknown group, invalid limits,
// unmapped endpoint). Raised at startup; never produced by a wait.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace pacer

#pragma once

#include "../core/env_flag.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace splitcpp::cli {

// Verbose logging is off unless SPLITCPP_LOG is truthy.
inline bool VerboseEnabled() {
  static const bool enabled = core::EnvFlag("SPLITCPP_LOG", false);
  return enabled;
}

inline void Log(std::string_view message) {
  if (!VerboseEnabled()) {
    return;
  }
  std::cerr << "[splitcpp] " << message << "\n";
}

inline void LogKV(std::string_view key, std::string_view value) {
  if (!VerboseEnabled()) {
    return;
  }
  std::cerr << "[splitcpp] " << key << "=" << value << "\n";
}

inline void LogKV(std::string_view key, std::uint64_t value) {
  LogKV(key, std::to_string(value));
}

inline void LogError(std::string_view message) {
  std::cerr << "[splitcpp] ERROR: " << message << "\n";
}

}  // namespace splitcpp::cli

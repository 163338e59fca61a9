#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace splitcpp::core {

inline bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

// Unset variables yield fallback; set ones must be 1/true/yes/on to count.
inline bool EnvFlag(const char* name, bool fallback) {
#if defined(_MSC_VER)
  char* env = nullptr;
  std::size_t len = 0;
  if (_dupenv_s(&env, &len, name) != 0 || env == nullptr) {
    return fallback;
  }
  std::string value(env);
  std::free(env);
  return IsTruthy(value);
#else
  const char* env = std::getenv(name);
  if (env == nullptr) {
    return fallback;
  }
  return IsTruthy(env);
#endif
}

}  // namespace splitcpp::core

#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace study {

// Diagnostic output is off unless the named environment variable is set to
// something other than "", "0" or "false".
inline bool debug_flag_enabled(const char* variable) {
  const char* env = std::getenv(variable);
  if (!env) {
    env = std::getenv("STUDY_DEBUG");
  }
  if (!env) {
    return false;
  }
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

inline void debug_line(const char* prefix, const std::string& message) {
  std::cerr << "[" << prefix << "] " << message << std::endl;
}

} // namespace study

#pragma once

#include <string>

namespace tilegrid {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_LABEL = "";

// Build version string from constants (single source of truth)
inline std::string get_version_string() {
  std::string version = std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
                        std::to_string(VERSION_PATCH);
  if (VERSION_LABEL[0] != '\0') {
    version += "-";
    version += VERSION_LABEL;
  }
  return version;
}

} // namespace tilegrid

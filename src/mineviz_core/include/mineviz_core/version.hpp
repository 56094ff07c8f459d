#pragma once

#include <string>
#include <string_view>

#ifndef MINEVIZ_CORE_VERSION_STR
#define MINEVIZ_CORE_VERSION_STR "0.0.0-dev"
#endif

namespace mineviz::core {
inline constexpr std::string_view kVersion = MINEVIZ_CORE_VERSION_STR;

inline std::string version() {
  return std::string(kVersion);
}
}  // namespace mineviz::core

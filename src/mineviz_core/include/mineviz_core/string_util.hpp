#pragma once

#include <string>

namespace mineviz::core {
std::string trim_copy(const std::string& value);
std::string to_lower_copy(std::string value);
}  // namespace mineviz::core

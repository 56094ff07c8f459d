#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/version.hpp"

#include <string>

int main() {
  if (mineviz::core::version().empty()) {
    return 1;
  }

  if (std::string(mineviz::core::color_ramp_name(mineviz::core::ColorRamp::kViridis)) !=
      "viridis") {
    return 2;
  }

  return 0;
}

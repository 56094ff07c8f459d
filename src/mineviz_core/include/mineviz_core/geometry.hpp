#pragma once

namespace mineviz::core {
struct Vec3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

// Screen pixels, y grows downward.
struct ScreenPoint {
  double x = 0.0;
  double y = 0.0;
};
}  // namespace mineviz::core

#pragma once

#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/geometry.hpp"

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace mineviz::core {
struct BoreholeCollar {
  std::string hole_id;
  double easting = 0.0;
  double northing = 0.0;
  double elevation = 0.0;
};

// Desurveyed station along the hole; depth is measured from the collar.
struct TraceStation {
  double depth = 0.0;
  double easting = 0.0;
  double northing = 0.0;
  double elevation = 0.0;
};

struct BoreholeInterval {
  double from_depth = 0.0;
  double to_depth = 0.0;
  std::unordered_map<std::string, double> quality_vector;
};

struct BoreholeColorOptions {
  std::string quality_field;
  double value_min = 0.0;
  double value_max = 100.0;
  ColorRamp ramp = ColorRamp::kViridis;
};

struct IntervalSegment {
  std::array<float, 3> start {0.0f, 0.0f, 0.0f};
  std::array<float, 3> end {0.0f, 0.0f, 0.0f};
  Rgb color;
  double value = 0.0;
  int interval_index = -1;
};

struct BoreholeGeometry {
  std::array<float, 3> collar {0.0f, 0.0f, 0.0f};
  std::vector<float> trace_points;  // render-space xyz per station
  std::vector<IntervalSegment> segments;
  int skipped_interval_count = 0;
};

std::array<float, 3> to_render_space(double easting, double northing, double elevation,
                                     const Vec3& offset);

BoreholeGeometry build_borehole_geometry(const BoreholeCollar& collar,
                                         const std::vector<TraceStation>& trace,
                                         const std::vector<BoreholeInterval>& intervals,
                                         const BoreholeColorOptions& options,
                                         const Vec3& offset = {});
}  // namespace mineviz::core

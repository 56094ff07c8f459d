#pragma once

#include <array>
#include <string>
#include <vector>

namespace mineviz::core {
struct Rgb {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
};

enum class ColorRamp : int {
  kViridis = 0,
  kPlasma = 1,
  kCoal = 2,
  kThermal = 3,
  kRedYellowGreen = 4,
  kTerrain = 5,
  kSeam = 6,
  kDesign = 7,
};

struct LegendTick {
  double value = 0.0;
  double position = 0.0;  // 0..1 along the legend bar
  std::string label;
};

struct GradientStop {
  double position = 0.0;
  Rgb color;
};

// Unknown names resolve to viridis.
ColorRamp parse_color_ramp(const std::string& name);
const char* color_ramp_name(ColorRamp ramp);
const std::vector<Rgb>& ramp_control_colors(ColorRamp ramp);

// Piecewise-linear lookup of value within [min, max]. A zero-width range returns the ramp
// midpoint.
Rgb color_at(double value, double min, double max, ColorRamp ramp);
Rgb color_at(double value, double min, double max, const std::string& ramp_id);
Rgb ramp_midpoint(ColorRamp ramp);

std::vector<LegendTick> build_legend_ticks(double min, double max, int num_ticks = 5);
std::vector<GradientStop> sample_ramp(ColorRamp ramp, int steps);
}  // namespace mineviz::core

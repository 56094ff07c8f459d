#include "mineviz_core/color/color_ramp.hpp"

#include "mineviz_core/string_util.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mineviz::core {
namespace {
const std::vector<Rgb> kViridis = {
  {0.267f, 0.004f, 0.329f}, {0.282f, 0.140f, 0.458f}, {0.254f, 0.265f, 0.529f},
  {0.163f, 0.471f, 0.558f}, {0.134f, 0.658f, 0.517f}, {0.477f, 0.821f, 0.318f},
  {0.993f, 0.906f, 0.144f},
};

const std::vector<Rgb> kPlasma = {
  {0.050f, 0.030f, 0.528f}, {0.417f, 0.000f, 0.658f}, {0.693f, 0.165f, 0.564f},
  {0.881f, 0.392f, 0.383f}, {0.988f, 0.652f, 0.212f}, {0.940f, 0.975f, 0.131f},
};

// Low calorific value dark, high CV bright.
const std::vector<Rgb> kCoal = {
  {0.1f, 0.1f, 0.1f}, {0.3f, 0.2f, 0.1f}, {0.5f, 0.4f, 0.2f},
  {0.7f, 0.6f, 0.3f}, {0.9f, 0.85f, 0.5f},
};

const std::vector<Rgb> kThermal = {
  {0.1f, 0.1f, 0.5f}, {0.2f, 0.2f, 0.8f}, {0.5f, 0.3f, 0.8f},
  {0.8f, 0.3f, 0.3f}, {1.0f, 0.8f, 0.2f},
};

const std::vector<Rgb> kRedYellowGreen = {
  {0.843f, 0.188f, 0.121f}, {0.992f, 0.682f, 0.380f}, {0.996f, 0.996f, 0.596f},
  {0.651f, 0.851f, 0.416f}, {0.102f, 0.596f, 0.314f},
};

// Water blue, vegetation green, dry grass, exposed soil, snow.
const std::vector<Rgb> kTerrain = {
  {0.12f, 0.29f, 0.65f}, {0.20f, 0.55f, 0.25f}, {0.62f, 0.70f, 0.22f},
  {0.55f, 0.38f, 0.20f}, {0.92f, 0.92f, 0.92f},
};

const std::vector<Rgb> kSeam = {
  {0.102f, 0.102f, 0.102f}, {0.192f, 0.192f, 0.192f}, {0.290f, 0.290f, 0.290f},
};

const std::vector<Rgb> kDesign = {
  {0.16f, 0.496f, 0.64f}, {0.26f, 0.596f, 0.74f}, {0.36f, 0.696f, 0.84f},
};

Rgb lerp(const Rgb& a, const Rgb& b, const float f) {
  return {
    a.r + (b.r - a.r) * f,
    a.g + (b.g - a.g) * f,
    a.b + (b.b - a.b) * f,
  };
}

Rgb interpolate_ramp(const std::vector<Rgb>& colors, const double t) {
  if (colors.size() == 1 || t >= 1.0) {
    return colors.back();
  }
  const double segment = t * static_cast<double>(colors.size() - 1);
  const std::size_t idx = static_cast<std::size_t>(std::floor(segment));
  if (idx >= colors.size() - 1) {
    return colors.back();
  }
  const float f = static_cast<float>(segment - static_cast<double>(idx));
  return lerp(colors[idx], colors[idx + 1], f);
}
}  // namespace

ColorRamp parse_color_ramp(const std::string& name) {
  const std::string normalized = to_lower_copy(name);
  if (normalized == "viridis") {
    return ColorRamp::kViridis;
  }
  if (normalized == "plasma") {
    return ColorRamp::kPlasma;
  }
  if (normalized == "coal") {
    return ColorRamp::kCoal;
  }
  if (normalized == "thermal") {
    return ColorRamp::kThermal;
  }
  if (normalized == "red_yellow_green" || normalized == "redyellowgreen") {
    return ColorRamp::kRedYellowGreen;
  }
  if (normalized == "terrain") {
    return ColorRamp::kTerrain;
  }
  if (normalized == "seam") {
    return ColorRamp::kSeam;
  }
  if (normalized == "design") {
    return ColorRamp::kDesign;
  }
  return ColorRamp::kViridis;
}

const char* color_ramp_name(const ColorRamp ramp) {
  switch (ramp) {
    case ColorRamp::kPlasma:
      return "plasma";
    case ColorRamp::kCoal:
      return "coal";
    case ColorRamp::kThermal:
      return "thermal";
    case ColorRamp::kRedYellowGreen:
      return "red_yellow_green";
    case ColorRamp::kTerrain:
      return "terrain";
    case ColorRamp::kSeam:
      return "seam";
    case ColorRamp::kDesign:
      return "design";
    case ColorRamp::kViridis:
    default:
      return "viridis";
  }
}

const std::vector<Rgb>& ramp_control_colors(const ColorRamp ramp) {
  switch (ramp) {
    case ColorRamp::kPlasma:
      return kPlasma;
    case ColorRamp::kCoal:
      return kCoal;
    case ColorRamp::kThermal:
      return kThermal;
    case ColorRamp::kRedYellowGreen:
      return kRedYellowGreen;
    case ColorRamp::kTerrain:
      return kTerrain;
    case ColorRamp::kSeam:
      return kSeam;
    case ColorRamp::kDesign:
      return kDesign;
    case ColorRamp::kViridis:
    default:
      return kViridis;
  }
}

Rgb ramp_midpoint(const ColorRamp ramp) {
  return interpolate_ramp(ramp_control_colors(ramp), 0.5);
}

Rgb color_at(const double value, const double min, const double max, const ColorRamp ramp) {
  const double range = max - min;
  if (range == 0.0 || !std::isfinite(range) || !std::isfinite(value)) {
    return ramp_midpoint(ramp);
  }
  const double t = std::clamp((value - min) / range, 0.0, 1.0);
  return interpolate_ramp(ramp_control_colors(ramp), t);
}

Rgb color_at(const double value, const double min, const double max, const std::string& ramp_id) {
  return color_at(value, min, max, parse_color_ramp(ramp_id));
}

std::vector<LegendTick> build_legend_ticks(const double min, const double max,
                                           const int num_ticks) {
  std::vector<LegendTick> ticks;
  if (num_ticks <= 0) {
    return ticks;
  }
  ticks.reserve(static_cast<std::size_t>(num_ticks));
  for (int i = 0; i < num_ticks; ++i) {
    const double t = num_ticks == 1 ? 0.0 : static_cast<double>(i) / (num_ticks - 1);
    LegendTick tick;
    tick.value = min + t * (max - min);
    tick.position = t;
    std::ostringstream label;
    label << std::fixed << std::setprecision(tick.value < 10.0 ? 1 : 0) << tick.value;
    tick.label = label.str();
    ticks.push_back(std::move(tick));
  }
  return ticks;
}

std::vector<GradientStop> sample_ramp(const ColorRamp ramp, const int steps) {
  const int count = std::max(steps, 2);
  std::vector<GradientStop> stops;
  stops.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    const double t = static_cast<double>(i) / (count - 1);
    stops.push_back({t, color_at(t, 0.0, 1.0, ramp)});
  }
  return stops;
}
}  // namespace mineviz::core

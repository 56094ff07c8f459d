#include "mineviz_core/case_config.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mineviz::core {
namespace {
CaseKv parse_case_stream(std::istream& in) {
  CaseKv kv;
  std::string line;
  while (std::getline(in, line)) {
    const std::string stripped = trim_copy(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    std::size_t sep = stripped.find('=');
    if (sep == std::string::npos) {
      sep = stripped.find(':');
    }
    if (sep == std::string::npos) {
      continue;
    }

    const std::string key = trim_copy(stripped.substr(0, sep));
    const std::string value = trim_copy(stripped.substr(sep + 1));
    if (!key.empty()) {
      kv[key] = value;
    }
  }
  return kv;
}

bool parse_double(const std::string& text, double* out) {
  const std::string value = trim_copy(text);
  if (value.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size() || errno == ERANGE || !std::isfinite(parsed)) {
    return false;
  }
  *out = parsed;
  return true;
}
}  // namespace

CaseKv parse_case_kv(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  return parse_case_stream(in);
}

CaseKv parse_case_kv_text(const std::string& text) {
  std::istringstream in(text);
  return parse_case_stream(in);
}

std::string get_string(const CaseKv& kv, const char* key, const std::string& fallback) {
  const auto it = kv.find(key);
  if (it == kv.end() || it->second.empty()) {
    return fallback;
  }
  return it->second;
}

bool has_key(const CaseKv& kv, const char* key) {
  return kv.find(key) != kv.end();
}

double get_double(const CaseKv& kv, const char* key, const double fallback) {
  const auto it = kv.find(key);
  if (it == kv.end()) {
    return fallback;
  }
  double value = fallback;
  return parse_double(it->second, &value) ? value : fallback;
}

int get_int(const CaseKv& kv, const char* key, const int fallback) {
  const auto it = kv.find(key);
  if (it == kv.end()) {
    return fallback;
  }
  double value = 0.0;
  if (!parse_double(it->second, &value) || value != std::floor(value) ||
      value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max())) {
    return fallback;
  }
  return static_cast<int>(value);
}

bool parse_on_off(const std::string& value, const bool fallback) {
  const std::string normalized = to_lower_copy(trim_copy(value));
  if (normalized == "on" || normalized == "true" || normalized == "yes" || normalized == "1") {
    return true;
  }
  if (normalized == "off" || normalized == "false" || normalized == "no" || normalized == "0") {
    return false;
  }
  return fallback;
}

bool get_on_off(const CaseKv& kv, const char* key, const bool fallback) {
  const auto it = kv.find(key);
  if (it == kv.end()) {
    return fallback;
  }
  return parse_on_off(it->second, fallback);
}

VizConfig load_viz_config(const CaseKv& kv) {
  VizConfig config;
  config.viewport_width = get_double(kv, "viewport_width", config.viewport_width);
  config.viewport_height = get_double(kv, "viewport_height", config.viewport_height);
  config.default_ramp = parse_color_ramp(get_string(kv, "color_ramp", "viridis"));
  config.mesh_cache_capacity = static_cast<std::size_t>(
    std::max(get_int(kv, "mesh_cache_capacity", static_cast<int>(config.mesh_cache_capacity)), 1));

  ProfileViewConfig& profile = config.profile;
  profile.padding_px = get_double(kv, "profile_padding_px", profile.padding_px);
  profile.distance_pad_fraction =
    get_double(kv, "profile_distance_pad_fraction", profile.distance_pad_fraction);
  profile.elevation_pad_fraction =
    get_double(kv, "profile_elevation_pad_fraction", profile.elevation_pad_fraction);
  profile.distance_fallback_pad =
    get_double(kv, "profile_distance_fallback_pad", profile.distance_fallback_pad);
  profile.elevation_fallback_pad =
    get_double(kv, "profile_elevation_fallback_pad", profile.elevation_fallback_pad);
  profile.grid_divisions = get_double(kv, "grid_divisions", profile.grid_divisions);
  profile.major_every = get_int(kv, "grid_major_every", profile.major_every);
  profile.nearest_cutoff_fraction =
    get_double(kv, "nearest_cutoff_fraction", profile.nearest_cutoff_fraction);
  profile.zoom_min = get_double(kv, "zoom_min", profile.zoom_min);
  profile.zoom_max = get_double(kv, "zoom_max", profile.zoom_max);
  profile.zoom_step = get_double(kv, "zoom_step", profile.zoom_step);

  FlowLayoutConfig& flow = config.flow;
  flow.column_count = get_int(kv, "flow_column_count", flow.column_count);
  flow.column_x0 = get_double(kv, "flow_column_x0", flow.column_x0);
  flow.column_spacing = get_double(kv, "flow_column_spacing", flow.column_spacing);
  flow.row_y0 = get_double(kv, "flow_row_y0", flow.row_y0);
  flow.row_pitch = get_double(kv, "flow_row_pitch", flow.row_pitch);
  flow.node_width = get_double(kv, "flow_node_width", flow.node_width);
  flow.node_min_height = get_double(kv, "flow_node_min_height", flow.node_min_height);
  flow.node_max_height = get_double(kv, "flow_node_max_height", flow.node_max_height);
  flow.link_min_thickness = get_double(kv, "flow_link_min_thickness", flow.link_min_thickness);
  flow.link_max_thickness = get_double(kv, "flow_link_max_thickness", flow.link_max_thickness);
  flow.link_edge_gap = get_double(kv, "flow_link_edge_gap", flow.link_edge_gap);
  flow.curve_control_offset =
    get_double(kv, "flow_curve_control_offset", flow.curve_control_offset);
  return config;
}

void validate_viz_config(const VizConfig& config) {
  if (config.viewport_width <= 0.0 || config.viewport_height <= 0.0) {
    throw std::invalid_argument("Viewport width and height must be positive.");
  }
  const ProfileViewConfig& profile = config.profile;
  if (profile.padding_px < 0.0) {
    throw std::invalid_argument("Profile padding must be non-negative.");
  }
  if (profile.distance_pad_fraction < 0.0 || profile.elevation_pad_fraction < 0.0 ||
      profile.distance_fallback_pad <= 0.0 || profile.elevation_fallback_pad <= 0.0) {
    throw std::invalid_argument("Profile bounds padding must be non-negative with positive "
                                "fallbacks.");
  }
  if (profile.grid_divisions < kMinGridDivisions || profile.grid_divisions > kMaxGridDivisions) {
    throw std::invalid_argument("grid_divisions must lie in [1, 100].");
  }
  if (profile.major_every < 1) {
    throw std::invalid_argument("Grid major multiple must be positive.");
  }
  if (profile.nearest_cutoff_fraction < 0.0) {
    throw std::invalid_argument("Nearest-point cutoff fraction must be non-negative.");
  }
  if (profile.zoom_min <= 0.0 || profile.zoom_max < profile.zoom_min || profile.zoom_step <= 1.0) {
    throw std::invalid_argument("Zoom limits must satisfy 0 < zoom_min <= zoom_max and "
                                "zoom_step > 1.");
  }
  const FlowLayoutConfig& flow = config.flow;
  if (flow.column_count < 1) {
    throw std::invalid_argument("Flow layout needs at least one column.");
  }
  if (flow.node_min_height < 0.0 || flow.node_max_height < flow.node_min_height) {
    throw std::invalid_argument("Flow node height range is invalid.");
  }
  if (flow.link_min_thickness < 0.0 || flow.link_max_thickness < 0.0) {
    throw std::invalid_argument("Flow link thickness must be non-negative.");
  }
}
}  // namespace mineviz::core

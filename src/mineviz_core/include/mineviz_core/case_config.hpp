#pragma once

#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/flow/flow_layout.hpp"
#include "mineviz_core/profile/profile_view.hpp"
#include "mineviz_core/string_util.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace mineviz::core {
using CaseKv = std::unordered_map<std::string, std::string>;

inline constexpr double kMinGridDivisions = 1.0;
inline constexpr double kMaxGridDivisions = 100.0;

struct VizConfig {
  double viewport_width = 600.0;
  double viewport_height = 300.0;
  ColorRamp default_ramp = ColorRamp::kViridis;
  std::size_t mesh_cache_capacity = 16;
  ProfileViewConfig profile;
  FlowLayoutConfig flow;
};

// One "key = value" or "key: value" per line; blank lines and '#' comments are ignored.
// A missing file yields an empty map.
CaseKv parse_case_kv(const std::filesystem::path& path);
CaseKv parse_case_kv_text(const std::string& text);

// Typed lookups fall back when the key is absent or the value does not parse.
std::string get_string(const CaseKv& kv, const char* key, const std::string& fallback);
bool has_key(const CaseKv& kv, const char* key);
double get_double(const CaseKv& kv, const char* key, double fallback);
int get_int(const CaseKv& kv, const char* key, int fallback);
bool parse_on_off(const std::string& value, bool fallback);
bool get_on_off(const CaseKv& kv, const char* key, bool fallback);

VizConfig load_viz_config(const CaseKv& kv);
// Throws std::invalid_argument for settings that would make a view degenerate.
void validate_viz_config(const VizConfig& config);
}  // namespace mineviz::core

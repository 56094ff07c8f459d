#pragma once

#include "mineviz_core/geometry.hpp"

#include <string>
#include <vector>

namespace mineviz::core {
struct FlowNode {
  std::string name;
  int column = 0;
  double inflow_tonnes = 0.0;
  double outflow_tonnes = 0.0;
};

struct FlowLink {
  std::string source;
  std::string target;
  std::string material;
  double tonnes = 0.0;
  int loads = 0;
};

struct FlowLayoutConfig {
  int column_count = 3;
  double column_x0 = 100.0;
  double column_spacing = 200.0;
  double row_y0 = 60.0;
  double row_pitch = 80.0;
  double node_width = 100.0;
  double node_min_height = 30.0;
  double node_max_height = 60.0;
  double link_min_thickness = 4.0;
  double link_max_thickness = 30.0;
  double link_edge_gap = 10.0;
  double curve_control_offset = 40.0;
};

struct RgbaColor {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;
};

struct PositionedNode {
  std::string name;
  int column = 0;
  int row = 0;
  double x = 0.0;  // node centre
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
  double inflow_tonnes = 0.0;
  double outflow_tonnes = 0.0;
  double flow = 0.0;
};

// Cubic Bezier from p0 to p3.
struct LinkPath {
  ScreenPoint p0;
  ScreenPoint c1;
  ScreenPoint c2;
  ScreenPoint p3;
};

struct PositionedLink {
  std::string source;
  std::string target;
  std::string material;
  double tonnes = 0.0;
  int loads = 0;
  double thickness = 0.0;
  LinkPath path;
  RgbaColor color;
};

struct FlowSummary {
  int link_count = 0;
  double total_tonnes = 0.0;
  long long total_loads = 0;
  int dropped_link_count = 0;
  std::vector<std::string> materials;
};

struct FlowLayout {
  std::vector<PositionedNode> nodes;
  std::vector<PositionedLink> links;
  double max_tonnes = 0.0;
  double max_node_flow = 0.0;
  FlowSummary summary;
};

inline constexpr const char* kAllMaterials = "all";

RgbaColor material_color(const std::string& material);
std::vector<std::string> collect_materials(const std::vector<FlowLink>& links);
LinkPath make_link_path(const PositionedNode& source, const PositionedNode& target,
                        const FlowLayoutConfig& config);

FlowLayout layout_flow_graph(const std::vector<FlowNode>& nodes,
                             const std::vector<FlowLink>& links,
                             const std::string& material_filter = kAllMaterials,
                             const FlowLayoutConfig& config = {});
}  // namespace mineviz::core

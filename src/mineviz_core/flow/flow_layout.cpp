#include "mineviz_core/flow/flow_layout.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mineviz::core {
namespace {
bool passes_filter(const FlowLink& link, const std::string& material_filter) {
  return material_filter == kAllMaterials || link.material == material_filter;
}

double node_height(const double flow, const double max_flow, const FlowLayoutConfig& config) {
  if (!(max_flow > 0.0)) {
    return config.node_min_height;
  }
  return std::clamp(flow / max_flow * config.node_max_height, config.node_min_height,
                    config.node_max_height);
}

double link_thickness(const double tonnes, const double max_tonnes,
                      const FlowLayoutConfig& config) {
  if (!(max_tonnes > 0.0)) {
    return config.link_min_thickness;
  }
  return std::max(config.link_min_thickness, tonnes / max_tonnes * config.link_max_thickness);
}
}  // namespace

RgbaColor material_color(const std::string& material) {
  if (material == "ore_high_grade") {
    return {34.0f / 255.0f, 197.0f / 255.0f, 94.0f / 255.0f, 0.5f};
  }
  if (material == "ore_low_grade") {
    return {132.0f / 255.0f, 204.0f / 255.0f, 22.0f / 255.0f, 0.5f};
  }
  if (material == "marginal") {
    return {234.0f / 255.0f, 179.0f / 255.0f, 8.0f / 255.0f, 0.5f};
  }
  if (material == "waste") {
    return {107.0f / 255.0f, 114.0f / 255.0f, 128.0f / 255.0f, 0.5f};
  }
  if (material == "overburden") {
    return {75.0f / 255.0f, 85.0f / 255.0f, 99.0f / 255.0f, 0.5f};
  }
  return {100.0f / 255.0f, 100.0f / 255.0f, 100.0f / 255.0f, 0.5f};
}

std::vector<std::string> collect_materials(const std::vector<FlowLink>& links) {
  std::vector<std::string> materials;
  std::unordered_set<std::string> seen;
  for (const auto& link : links) {
    if (seen.insert(link.material).second) {
      materials.push_back(link.material);
    }
  }
  return materials;
}

LinkPath make_link_path(const PositionedNode& source, const PositionedNode& target,
                        const FlowLayoutConfig& config) {
  const double start_x = source.x + 0.5 * source.width + config.link_edge_gap;
  const double end_x = target.x - 0.5 * target.width - config.link_edge_gap;
  return {
    {start_x, source.y},
    {start_x + config.curve_control_offset, source.y},
    {end_x - config.curve_control_offset, target.y},
    {end_x, target.y},
  };
}

FlowLayout layout_flow_graph(const std::vector<FlowNode>& nodes,
                             const std::vector<FlowLink>& links,
                             const std::string& material_filter,
                             const FlowLayoutConfig& config) {
  FlowLayout layout;
  layout.summary.materials = collect_materials(links);

  std::unordered_map<std::string, int> node_index;
  node_index.reserve(nodes.size());
  for (int n = 0; n < static_cast<int>(nodes.size()); ++n) {
    node_index.emplace(nodes[static_cast<std::size_t>(n)].name, n);
  }

  const int column_count = std::max(config.column_count, 1);
  std::vector<int> rows_used(static_cast<std::size_t>(column_count), 0);
  layout.nodes.reserve(nodes.size());
  for (const auto& node : nodes) {
    PositionedNode placed;
    placed.name = node.name;
    placed.column = std::clamp(node.column, 0, column_count - 1);
    placed.row = rows_used[static_cast<std::size_t>(placed.column)]++;
    placed.x = config.column_x0 + placed.column * config.column_spacing;
    placed.y = config.row_y0 + placed.row * config.row_pitch;
    placed.width = config.node_width;
    layout.nodes.push_back(std::move(placed));
  }

  std::vector<const FlowLink*> kept;
  kept.reserve(links.size());
  for (const auto& link : links) {
    if (!passes_filter(link, material_filter)) {
      continue;
    }
    const auto source = node_index.find(link.source);
    const auto target = node_index.find(link.target);
    if (source == node_index.end() || target == node_index.end()) {
      ++layout.summary.dropped_link_count;
      continue;
    }
    layout.nodes[static_cast<std::size_t>(source->second)].outflow_tonnes += link.tonnes;
    layout.nodes[static_cast<std::size_t>(target->second)].inflow_tonnes += link.tonnes;
    layout.max_tonnes = std::max(layout.max_tonnes, link.tonnes);
    layout.summary.total_tonnes += link.tonnes;
    layout.summary.total_loads += link.loads;
    kept.push_back(&link);
  }
  layout.summary.link_count = static_cast<int>(kept.size());

  for (auto& placed : layout.nodes) {
    placed.flow = std::max(placed.inflow_tonnes, placed.outflow_tonnes);
    layout.max_node_flow = std::max(layout.max_node_flow, placed.flow);
  }
  for (auto& placed : layout.nodes) {
    placed.height = node_height(placed.flow, layout.max_node_flow, config);
  }

  layout.links.reserve(kept.size());
  for (const FlowLink* link : kept) {
    const auto& source = layout.nodes[static_cast<std::size_t>(node_index.at(link->source))];
    const auto& target = layout.nodes[static_cast<std::size_t>(node_index.at(link->target))];

    PositionedLink placed;
    placed.source = link->source;
    placed.target = link->target;
    placed.material = link->material;
    placed.tonnes = link->tonnes;
    placed.loads = link->loads;
    placed.thickness = link_thickness(link->tonnes, layout.max_tonnes, config);
    placed.path = make_link_path(source, target, config);
    placed.color = material_color(link->material);
    layout.links.push_back(std::move(placed));
  }

  return layout;
}
}  // namespace mineviz::core

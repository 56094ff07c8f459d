#include "mineviz_core/demo_data.hpp"
#include "mineviz_core/flow/flow_layout.hpp"

#include <cmath>
#include <iostream>
#include <vector>

namespace {
bool near(const double a, const double b, const double tol = 1.0e-9) {
  return std::abs(a - b) <= tol;
}

const mineviz::core::PositionedNode* find_node(const mineviz::core::FlowLayout& layout,
                                               const char* name) {
  for (const auto& node : layout.nodes) {
    if (node.name == name) {
      return &node;
    }
  }
  return nullptr;
}
}  // namespace

int main() {
  const std::vector<mineviz::core::FlowNode> nodes = {
    {"A", 0, 0.0, 0.0},
    {"B", 1, 0.0, 0.0},
    {"C", 1, 0.0, 0.0},
  };
  const std::vector<mineviz::core::FlowLink> links = {
    {"A", "B", "ore_high_grade", 100.0, 10},
    {"A", "C", "waste", 50.0, 5},
  };

  const mineviz::core::FlowLayout layout = mineviz::core::layout_flow_graph(nodes, links);
  if (layout.links.size() != 2 || layout.summary.dropped_link_count != 0) {
    std::cerr << "Expected both links to be laid out.\n";
    return 1;
  }
  if (!near(layout.links[0].thickness / layout.links[1].thickness, 2.0)) {
    std::cerr << "Link thickness is not proportional to tonnes.\n";
    return 2;
  }

  const auto* a = find_node(layout, "A");
  const auto* b = find_node(layout, "B");
  const auto* c = find_node(layout, "C");
  if (a == nullptr || b == nullptr || c == nullptr) {
    std::cerr << "Missing laid-out node.\n";
    return 3;
  }
  if (!near(a->outflow_tonnes, 150.0) || !near(b->inflow_tonnes, 100.0) ||
      !near(c->inflow_tonnes, 50.0)) {
    std::cerr << "Node flow totals mismatch.\n";
    return 4;
  }

  // Columns place left to right and rows stack within a column.
  if (!near(a->x, 100.0) || !near(b->x, 300.0) || b->row != 0 || c->row != 1 ||
      !near(c->y, 140.0)) {
    std::cerr << "Node placement mismatch.\n";
    return 5;
  }
  // Heights scale with flow between the configured limits.
  if (!near(a->height, 60.0) || !near(c->height, 30.0) || !near(b->height, 40.0)) {
    std::cerr << "Node heights mismatch: " << a->height << "," << b->height << ","
              << c->height << "\n";
    return 6;
  }

  // Paths leave the source's right edge and enter the target's left edge.
  const auto& path = layout.links[0].path;
  if (!near(path.p0.x, 160.0) || !near(path.p3.x, 240.0) || !near(path.c1.x, 200.0) ||
      !near(path.c2.x, 200.0) || !near(path.p0.y, a->y) || !near(path.p3.y, b->y)) {
    std::cerr << "Link path control points mismatch.\n";
    return 7;
  }
  if (!near(layout.summary.total_tonnes, 150.0) || layout.summary.total_loads != 15 ||
      layout.summary.materials.size() != 2) {
    std::cerr << "Flow summary mismatch.\n";
    return 8;
  }

  // Material filter keeps only the matching links.
  const auto waste_only = mineviz::core::layout_flow_graph(nodes, links, "waste");
  if (waste_only.links.size() != 1 || waste_only.links[0].material != "waste" ||
      !near(find_node(waste_only, "A")->outflow_tonnes, 50.0)) {
    std::cerr << "Material filter was not applied.\n";
    return 9;
  }

  // Links naming unknown nodes are dropped and counted.
  std::vector<mineviz::core::FlowLink> with_orphan = links;
  with_orphan.push_back({"A", "Nowhere", "waste", 500.0, 50});
  const auto dropped = mineviz::core::layout_flow_graph(nodes, with_orphan);
  if (dropped.links.size() != 2 || dropped.summary.dropped_link_count != 1 ||
      !near(dropped.max_tonnes, 100.0)) {
    std::cerr << "Orphan link was not dropped.\n";
    return 10;
  }

  // Tiny flows still get a visible link.
  const std::vector<mineviz::core::FlowLink> skewed = {
    {"A", "B", "waste", 10000.0, 1},
    {"A", "C", "waste", 1.0, 1},
  };
  const auto thin = mineviz::core::layout_flow_graph(nodes, skewed);
  if (!near(thin.links[1].thickness, 4.0)) {
    std::cerr << "Minimum link thickness was not applied.\n";
    return 11;
  }

  const auto color = mineviz::core::material_color("unknown_material");
  if (!near(color.a, 0.5, 1.0e-6) || !near(color.r, 100.0 / 255.0, 1.0e-6)) {
    std::cerr << "Unknown material did not get the default color.\n";
    return 12;
  }

  const auto demo = mineviz::core::layout_flow_graph(mineviz::core::make_demo_flow_nodes(),
                                                     mineviz::core::make_demo_flow_links());
  if (demo.nodes.size() != 6 || demo.links.size() != 6 || demo.summary.dropped_link_count != 0) {
    std::cerr << "Demo flow graph did not lay out cleanly.\n";
    return 13;
  }

  return 0;
}

#pragma once

#include "mineviz_core/blocks/block_sectioner.hpp"
#include "mineviz_core/flow/flow_layout.hpp"
#include "mineviz_core/profile/profile_view.hpp"
#include "mineviz_core/surface/surface_mesh.hpp"

#include <string>
#include <vector>

namespace mineviz::core {
// Rolling pit-floor terrain used by the demo generators.
double demo_terrain_height(double x, double y);

// Regular grid TIN with nx * ny cells, two counter-clockwise triangles per cell.
Surface make_demo_surface(int nx, int ny, double spacing,
                          const std::string& surface_type = "terrain");

// Full nx * ny * nz block grid; value carries a CV-like grade, quality_vector adds "cv" and
// "ash".
std::vector<Block> make_demo_blocks(const BlockModelDefinition& definition, double origin_x = 0.0,
                                    double origin_y = 0.0, double origin_z = 0.0);

inline constexpr int kMaxDemoProfilePoints = 100000;

// East-west section through the demo terrain plus a flat design floor below it. Returns empty
// profiles when the spacing would produce more than kMaxDemoProfilePoints stations.
std::vector<Profile> make_demo_profiles(double length, double spacing);

// Pits -> stockpiles -> destinations, three columns.
std::vector<FlowNode> make_demo_flow_nodes();
std::vector<FlowLink> make_demo_flow_links();
}  // namespace mineviz::core

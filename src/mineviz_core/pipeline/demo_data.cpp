#include "mineviz_core/demo_data.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace mineviz::core {
double demo_terrain_height(const double x, const double y) {
  return 100.0 + 10.0 * std::sin(x / 50.0) * std::cos(y / 40.0) + 0.05 * x;
}

Surface make_demo_surface(const int nx, const int ny, const double spacing,
                          const std::string& surface_type) {
  Surface surface;
  surface.name = "demo_" + surface_type;
  surface.surface_type = surface_type;
  if (nx <= 0 || ny <= 0) {
    return surface;
  }

  auto point_id = [nx](const int i, const int j) { return j * (nx + 1) + i; };

  surface.vertices.reserve(static_cast<std::size_t>(nx + 1) * (ny + 1));
  for (int j = 0; j <= ny; ++j) {
    for (int i = 0; i <= nx; ++i) {
      const double x = i * spacing;
      const double y = j * spacing;
      surface.vertices.push_back({x, y, demo_terrain_height(x, y)});
    }
  }

  surface.triangles.reserve(static_cast<std::size_t>(nx) * ny * 2);
  for (int j = 0; j < ny; ++j) {
    for (int i = 0; i < nx; ++i) {
      const int p00 = point_id(i, j);
      const int p10 = point_id(i + 1, j);
      const int p01 = point_id(i, j + 1);
      const int p11 = point_id(i + 1, j + 1);
      surface.triangles.push_back({p00, p10, p11});
      surface.triangles.push_back({p00, p11, p01});
    }
  }
  return surface;
}

std::vector<Block> make_demo_blocks(const BlockModelDefinition& definition, const double origin_x,
                                    const double origin_y, const double origin_z) {
  std::vector<Block> blocks;
  const int nx = std::max(definition.count_x, 0);
  const int ny = std::max(definition.count_y, 0);
  const int nz = std::max(definition.count_z, 0);
  blocks.reserve(static_cast<std::size_t>(nx) * ny * nz);

  for (int k = 0; k < nz; ++k) {
    for (int j = 0; j < ny; ++j) {
      for (int i = 0; i < nx; ++i) {
        Block block;
        block.i = i;
        block.j = j;
        block.k = k;
        block.x = origin_x + (i + 0.5) * definition.block_size_x;
        block.y = origin_y + (j + 0.5) * definition.block_size_y;
        block.z = origin_z + (k + 0.5) * definition.block_size_z;
        // Seam improves towards the centre of the deposit and with depth.
        const double cx = nx > 1 ? static_cast<double>(i) / (nx - 1) - 0.5 : 0.0;
        const double cy = ny > 1 ? static_cast<double>(j) / (ny - 1) - 0.5 : 0.0;
        const double depth = nz > 1 ? 1.0 - static_cast<double>(k) / (nz - 1) : 0.0;
        const double cv = 18.0 + 10.0 * (1.0 - 2.0 * (cx * cx + cy * cy)) + 4.0 * depth;
        block.value = cv;
        block.quality_vector["cv"] = cv;
        block.quality_vector["ash"] = 40.0 - cv;
        block.block_id = "B" + std::to_string(i) + "_" + std::to_string(j) + "_" +
                         std::to_string(k);
        blocks.push_back(std::move(block));
      }
    }
  }
  return blocks;
}

std::vector<Profile> make_demo_profiles(const double length, const double spacing) {
  Profile ground;
  ground.name = "Section A-A' (ground)";
  Profile design;
  design.name = "Section A-A' (design)";
  if (!(length >= 0.0) || !(spacing > 0.0) ||
      !(length / spacing <= static_cast<double>(kMaxDemoProfilePoints))) {
    return {ground, design};
  }

  const int steps = static_cast<int>(std::floor(length / spacing));
  for (int s = 0; s <= steps; ++s) {
    const double d = s * spacing;
    ground.points.push_back({d, demo_terrain_height(d, 0.0)});
    design.points.push_back({d, 85.0});
  }
  return {ground, design};
}

std::vector<FlowNode> make_demo_flow_nodes() {
  return {
    {"Pit North", 0, 0.0, 0.0},
    {"Pit South", 0, 0.0, 0.0},
    {"ROM Stockpile", 1, 0.0, 0.0},
    {"Low Grade Stock", 1, 0.0, 0.0},
    {"CHPP", 2, 0.0, 0.0},
    {"Waste Dump", 2, 0.0, 0.0},
  };
}

std::vector<FlowLink> make_demo_flow_links() {
  return {
    {"Pit North", "ROM Stockpile", "ore_high_grade", 12500.0, 125},
    {"Pit North", "Waste Dump", "overburden", 30000.0, 300},
    {"Pit South", "Low Grade Stock", "ore_low_grade", 6200.0, 62},
    {"Pit South", "Waste Dump", "waste", 8800.0, 88},
    {"ROM Stockpile", "CHPP", "ore_high_grade", 11000.0, 110},
    {"Low Grade Stock", "CHPP", "ore_low_grade", 4100.0, 41},
  };
}
}  // namespace mineviz::core

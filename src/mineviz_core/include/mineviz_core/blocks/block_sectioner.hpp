#pragma once

#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/geometry.hpp"

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace mineviz::core {
struct Block {
  int i = 0;
  int j = 0;
  int k = 0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
  double value = 0.0;
  std::unordered_map<std::string, double> quality_vector;
  std::string block_id;
};

// Counts of 0 mean "unknown"; block sizes are metres.
struct BlockModelDefinition {
  int count_x = 0;
  int count_y = 0;
  int count_z = 0;
  double block_size_x = 10.0;
  double block_size_y = 10.0;
  double block_size_z = 5.0;
};

// Section axes map one-to-one onto grid indices: X -> i, Y -> j, Z -> k.
enum class SectionAxis : int {
  kNone = 0,
  kX = 1,
  kY = 2,
  kZ = 3,
};

struct SectionFilter {
  SectionAxis axis = SectionAxis::kNone;
  int level = 0;
  int tolerance = 0;
};

struct GridLevels {
  int x = 0;
  int y = 0;
  int z = 0;
};

struct BlockInstanceBuffer {
  std::vector<float> translations;  // render-space xyz per block
  std::vector<float> colors;        // rgb per block
  std::array<float, 3> box_extent {0.0f, 0.0f, 0.0f};
};

SectionAxis parse_section_axis(const std::string& value);
const char* section_axis_name(SectionAxis axis);
int grid_index(const Block& block, SectionAxis axis);
int max_level(const GridLevels& levels, SectionAxis axis);

Vec3 compute_block_offset(const std::vector<Block>& blocks, bool auto_center);
GridLevels compute_max_levels(const std::vector<Block>& blocks,
                              const BlockModelDefinition* definition = nullptr);
std::vector<Block> filter_by_section(const std::vector<Block>& blocks, const SectionFilter& filter);
SectionFilter clamp_section_level(SectionFilter filter, const GridLevels& levels);

double block_value(const Block& block, const std::string& quality_field);
Vec3 block_size(const BlockModelDefinition* definition);
// Boxes are shrunk by gap_scale so neighbouring blocks stay visually separate.
BlockInstanceBuffer build_block_instances(const std::vector<Block>& blocks, const Vec3& offset,
                                          double value_min, double value_max, ColorRamp ramp,
                                          const std::string& quality_field = std::string(),
                                          const BlockModelDefinition* definition = nullptr,
                                          double gap_scale = 0.95);
}  // namespace mineviz::core

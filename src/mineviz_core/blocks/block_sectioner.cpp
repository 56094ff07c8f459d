#include "mineviz_core/blocks/block_sectioner.hpp"

#include "mineviz_core/string_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

namespace mineviz::core {
SectionAxis parse_section_axis(const std::string& value) {
  const std::string normalized = to_lower_copy(value);
  if (normalized == "x" || normalized == "i") {
    return SectionAxis::kX;
  }
  if (normalized == "y" || normalized == "j") {
    return SectionAxis::kY;
  }
  if (normalized == "z" || normalized == "k") {
    return SectionAxis::kZ;
  }
  return SectionAxis::kNone;
}

const char* section_axis_name(const SectionAxis axis) {
  switch (axis) {
    case SectionAxis::kX:
      return "x";
    case SectionAxis::kY:
      return "y";
    case SectionAxis::kZ:
      return "z";
    case SectionAxis::kNone:
    default:
      return "none";
  }
}

int grid_index(const Block& block, const SectionAxis axis) {
  switch (axis) {
    case SectionAxis::kX:
      return block.i;
    case SectionAxis::kY:
      return block.j;
    case SectionAxis::kZ:
      return block.k;
    case SectionAxis::kNone:
    default:
      return 0;
  }
}

int max_level(const GridLevels& levels, const SectionAxis axis) {
  switch (axis) {
    case SectionAxis::kX:
      return levels.x;
    case SectionAxis::kY:
      return levels.y;
    case SectionAxis::kZ:
      return levels.z;
    case SectionAxis::kNone:
    default:
      return 0;
  }
}

Vec3 compute_block_offset(const std::vector<Block>& blocks, const bool auto_center) {
  Vec3 offset;
  if (!auto_center || blocks.empty()) {
    return offset;
  }

  double x_min = blocks.front().x;
  double x_max = blocks.front().x;
  double y_min = blocks.front().y;
  double y_max = blocks.front().y;
  double z_min = blocks.front().z;
  double z_max = blocks.front().z;
  for (const auto& block : blocks) {
    x_min = std::min(x_min, block.x);
    x_max = std::max(x_max, block.x);
    y_min = std::min(y_min, block.y);
    y_max = std::max(y_max, block.y);
    z_min = std::min(z_min, block.z);
    z_max = std::max(z_max, block.z);
  }

  offset.x = 0.5 * (x_min + x_max);
  offset.y = 0.5 * (y_min + y_max);
  offset.z = 0.5 * (z_min + z_max);
  return offset;
}

GridLevels compute_max_levels(const std::vector<Block>& blocks,
                              const BlockModelDefinition* definition) {
  GridLevels levels;
  for (const auto& block : blocks) {
    levels.x = std::max(levels.x, block.i + 1);
    levels.y = std::max(levels.y, block.j + 1);
    levels.z = std::max(levels.z, block.k + 1);
  }

  if (definition != nullptr) {
    if (definition->count_x > 0) {
      levels.x = definition->count_x;
    }
    if (definition->count_y > 0) {
      levels.y = definition->count_y;
    }
    if (definition->count_z > 0) {
      levels.z = definition->count_z;
    }
  }
  return levels;
}

std::vector<Block> filter_by_section(const std::vector<Block>& blocks,
                                     const SectionFilter& filter) {
  if (filter.axis == SectionAxis::kNone) {
    return blocks;
  }

  const int tolerance = std::max(filter.tolerance, 0);
  std::vector<Block> visible;
  visible.reserve(blocks.size() / 4);
  for (const auto& block : blocks) {
    if (std::abs(grid_index(block, filter.axis) - filter.level) <= tolerance) {
      visible.push_back(block);
    }
  }
  return visible;
}

SectionFilter clamp_section_level(SectionFilter filter, const GridLevels& levels) {
  if (filter.axis == SectionAxis::kNone) {
    return filter;
  }
  const int upper = std::max(max_level(levels, filter.axis) - 1, 0);
  filter.level = std::clamp(filter.level, 0, upper);
  return filter;
}

double block_value(const Block& block, const std::string& quality_field) {
  if (!quality_field.empty()) {
    const auto it = block.quality_vector.find(quality_field);
    if (it != block.quality_vector.end()) {
      return it->second;
    }
  }
  return block.value;
}

Vec3 block_size(const BlockModelDefinition* definition) {
  if (definition == nullptr) {
    return {10.0, 10.0, 5.0};
  }
  return {definition->block_size_x, definition->block_size_y, definition->block_size_z};
}

BlockInstanceBuffer build_block_instances(const std::vector<Block>& blocks, const Vec3& offset,
                                          const double value_min, const double value_max,
                                          const ColorRamp ramp, const std::string& quality_field,
                                          const BlockModelDefinition* definition,
                                          const double gap_scale) {
  BlockInstanceBuffer buffer;
  const Vec3 size = block_size(definition);
  // Render space is y-up: world z becomes the second component.
  buffer.box_extent = {
    static_cast<float>(size.x * gap_scale),
    static_cast<float>(size.z * gap_scale),
    static_cast<float>(size.y * gap_scale),
  };

  buffer.translations.reserve(blocks.size() * 3);
  buffer.colors.reserve(blocks.size() * 3);
  for (const auto& block : blocks) {
    buffer.translations.push_back(static_cast<float>(block.x - offset.x));
    buffer.translations.push_back(static_cast<float>(block.z - offset.z));
    buffer.translations.push_back(static_cast<float>(block.y - offset.y));

    const Rgb color = color_at(block_value(block, quality_field), value_min, value_max, ramp);
    buffer.colors.push_back(color.r);
    buffer.colors.push_back(color.g);
    buffer.colors.push_back(color.b);
  }
  return buffer;
}
}  // namespace mineviz::core

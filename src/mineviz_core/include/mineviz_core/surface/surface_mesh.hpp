#pragma once

#include "mineviz_core/color/color_ramp.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace mineviz::core {
// TIN surface in local engineering coordinates (metres).
struct Surface {
  std::string name;
  std::string surface_type = "terrain";
  std::vector<std::array<double, 3>> vertices;
  std::vector<std::array<int, 3>> triangles;
};

struct ColorFieldSpec {
  // Explicit ramp; when unset the ramp is resolved from Surface::surface_type.
  std::optional<ColorRamp> ramp_override;
  // Per-vertex quality values. Used instead of elevation when sized to the vertex count.
  std::vector<double> vertex_values;
};

// Unindexed triangle soup: 3 vertices per valid triangle, xyz/rgb per vertex.
struct RenderableMesh {
  std::vector<float> positions;
  std::vector<float> normals;
  std::vector<float> colors;
  ColorRamp ramp = ColorRamp::kTerrain;
  double scalar_min = 0.0;
  double scalar_max = 0.0;
  int triangle_count = 0;
  int skipped_triangle_count = 0;
  int degenerate_triangle_count = 0;
};

struct ContourLine {
  double level = 0.0;
  std::vector<std::array<double, 3>> points;
};

ColorRamp resolve_surface_ramp(const std::string& surface_type,
                               const std::optional<ColorRamp>& ramp_override = std::nullopt);

// Returns std::nullopt when there is nothing to draw. Out-of-range triangles are skipped and
// zero-area triangles get a zero normal; both are counted on the result.
std::optional<RenderableMesh> build_surface_mesh(const Surface& surface,
                                                 const ColorFieldSpec& color_field = {});

std::array<float, 3> compute_face_normal(const std::array<double, 3>& v0,
                                         const std::array<double, 3>& v1,
                                         const std::array<double, 3>& v2, bool* degenerate);

// Contour points arrive in pairs (one segment per crossed triangle).
std::vector<float> build_contour_segments(const std::vector<ContourLine>& contours);
}  // namespace mineviz::core

#include "mineviz_core/surface/surface_mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace mineviz::core {
namespace {
// |a x b| relative to |a| |b|, i.e. the sine of the corner angle.
constexpr double kMinRelativeNormalNorm = 1.0e-12;

bool triangle_in_range(const std::array<int, 3>& tri, const int vertex_count) {
  for (const int index : tri) {
    if (index < 0 || index >= vertex_count) {
      return false;
    }
  }
  return true;
}

void push_xyz(std::vector<float>* out, const float x, const float y, const float z) {
  out->push_back(x);
  out->push_back(y);
  out->push_back(z);
}
}  // namespace

ColorRamp resolve_surface_ramp(const std::string& surface_type,
                               const std::optional<ColorRamp>& ramp_override) {
  if (ramp_override.has_value()) {
    return *ramp_override;
  }
  if (surface_type.find("seam") != std::string::npos) {
    return ColorRamp::kSeam;
  }
  if (surface_type.find("design") != std::string::npos) {
    return ColorRamp::kDesign;
  }
  return ColorRamp::kTerrain;
}

std::array<float, 3> compute_face_normal(const std::array<double, 3>& v0,
                                         const std::array<double, 3>& v1,
                                         const std::array<double, 3>& v2, bool* degenerate) {
  const double ax = v1[0] - v0[0];
  const double ay = v1[1] - v0[1];
  const double az = v1[2] - v0[2];
  const double bx = v2[0] - v0[0];
  const double by = v2[1] - v0[1];
  const double bz = v2[2] - v0[2];

  const double nx = ay * bz - az * by;
  const double ny = az * bx - ax * bz;
  const double nz = ax * by - ay * bx;
  const double norm = std::sqrt(nx * nx + ny * ny + nz * nz);
  const double edge_product =
    std::sqrt(ax * ax + ay * ay + az * az) * std::sqrt(bx * bx + by * by + bz * bz);

  const bool is_degenerate =
    !std::isfinite(norm) || norm <= kMinRelativeNormalNorm * edge_product || norm == 0.0;
  if (degenerate != nullptr) {
    *degenerate = is_degenerate;
  }
  if (is_degenerate) {
    return {0.0f, 0.0f, 0.0f};
  }
  const double inv_norm = 1.0 / norm;
  return {
    static_cast<float>(nx * inv_norm),
    static_cast<float>(ny * inv_norm),
    static_cast<float>(nz * inv_norm),
  };
}

std::optional<RenderableMesh> build_surface_mesh(const Surface& surface,
                                                 const ColorFieldSpec& color_field) {
  if (surface.vertices.empty() || surface.triangles.empty()) {
    return std::nullopt;
  }

  const int vertex_count = static_cast<int>(surface.vertices.size());
  const bool use_field = color_field.vertex_values.size() == surface.vertices.size();
  auto scalar_of = [&](const int vertex) {
    return use_field ? color_field.vertex_values[static_cast<std::size_t>(vertex)]
                     : surface.vertices[static_cast<std::size_t>(vertex)][2];
  };

  RenderableMesh mesh;
  mesh.ramp = resolve_surface_ramp(surface.surface_type, color_field.ramp_override);

  double scalar_min = std::numeric_limits<double>::infinity();
  double scalar_max = -std::numeric_limits<double>::infinity();
  for (int v = 0; v < vertex_count; ++v) {
    const double s = scalar_of(v);
    if (!std::isfinite(s)) {
      continue;
    }
    scalar_min = std::min(scalar_min, s);
    scalar_max = std::max(scalar_max, s);
  }
  if (scalar_min > scalar_max) {
    scalar_min = 0.0;
    scalar_max = 0.0;
  }
  mesh.scalar_min = scalar_min;
  mesh.scalar_max = scalar_max;

  const std::size_t reserve_floats = surface.triangles.size() * 9;
  mesh.positions.reserve(reserve_floats);
  mesh.normals.reserve(reserve_floats);
  mesh.colors.reserve(reserve_floats);

  for (const auto& tri : surface.triangles) {
    if (!triangle_in_range(tri, vertex_count)) {
      ++mesh.skipped_triangle_count;
      continue;
    }

    const auto& v0 = surface.vertices[static_cast<std::size_t>(tri[0])];
    const auto& v1 = surface.vertices[static_cast<std::size_t>(tri[1])];
    const auto& v2 = surface.vertices[static_cast<std::size_t>(tri[2])];

    bool degenerate = false;
    const std::array<float, 3> normal = compute_face_normal(v0, v1, v2, &degenerate);
    if (degenerate) {
      ++mesh.degenerate_triangle_count;
    }

    for (int corner = 0; corner < 3; ++corner) {
      const auto& v = surface.vertices[static_cast<std::size_t>(tri[corner])];
      push_xyz(&mesh.positions, static_cast<float>(v[0]), static_cast<float>(v[1]),
               static_cast<float>(v[2]));
      push_xyz(&mesh.normals, normal[0], normal[1], normal[2]);
      const Rgb color = color_at(scalar_of(tri[corner]), scalar_min, scalar_max, mesh.ramp);
      push_xyz(&mesh.colors, color.r, color.g, color.b);
    }
    ++mesh.triangle_count;
  }

  return mesh;
}

std::vector<float> build_contour_segments(const std::vector<ContourLine>& contours) {
  std::vector<float> positions;
  for (const auto& contour : contours) {
    const std::size_t paired = contour.points.size() - contour.points.size() % 2;
    for (std::size_t i = 0; i < paired; ++i) {
      const auto& p = contour.points[i];
      push_xyz(&positions, static_cast<float>(p[0]), static_cast<float>(p[1]),
               static_cast<float>(p[2]));
    }
  }
  return positions;
}
}  // namespace mineviz::core

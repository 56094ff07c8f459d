#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/io_vtk.hpp"
#include "mineviz_core/surface/surface_mesh.hpp"

#include <array>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
bool near(const float a, const float b, const float tol = 1.0e-5f) {
  return std::abs(a - b) <= tol;
}

bool same_color_at(const std::vector<float>& colors, const std::size_t vertex,
                   const mineviz::core::Rgb& expected) {
  return near(colors[3 * vertex + 0], expected.r) && near(colors[3 * vertex + 1], expected.g) &&
         near(colors[3 * vertex + 2], expected.b);
}
}  // namespace

int main() {
  using mineviz::core::ColorRamp;
  using mineviz::core::Surface;

  // Unit right triangle in the XY plane, counter-clockwise from above.
  {
    Surface surface;
    surface.vertices = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}};
    surface.triangles = {{0, 1, 2}};
    const auto mesh = mineviz::core::build_surface_mesh(surface);
    if (!mesh.has_value() || mesh->positions.size() != 9 || mesh->normals.size() != 9) {
      std::cerr << "Single triangle did not produce 9 position floats.\n";
      return 1;
    }
    for (int v = 0; v < 3; ++v) {
      if (!near(mesh->normals[3 * v + 0], 0.0f) || !near(mesh->normals[3 * v + 1], 0.0f) ||
          !near(mesh->normals[3 * v + 2], 1.0f)) {
        std::cerr << "Flat triangle normal is not +Z.\n";
        return 2;
      }
    }
  }

  // Triangles with out-of-range indices are excluded and counted.
  {
    Surface surface;
    surface.vertices = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {1.0, 1.0, 1.0}};
    surface.triangles = {{0, 1, 2}, {1, 3, 7}, {-1, 0, 1}, {1, 3, 2}};
    const auto mesh = mineviz::core::build_surface_mesh(surface);
    if (!mesh.has_value() || mesh->triangle_count != 2 || mesh->skipped_triangle_count != 2 ||
        mesh->positions.size() != 9u * 2u || mesh->colors.size() != mesh->positions.size()) {
      std::cerr << "Out-of-range triangles were not skipped.\n";
      return 3;
    }
  }

  // Zero-area triangles get a zero normal rather than NaN.
  {
    Surface surface;
    surface.vertices = {{0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}, {2.0, 2.0, 2.0}};
    surface.triangles = {{0, 1, 2}};
    const auto mesh = mineviz::core::build_surface_mesh(surface);
    if (!mesh.has_value() || mesh->degenerate_triangle_count != 1) {
      std::cerr << "Collinear triangle was not flagged degenerate.\n";
      return 4;
    }
    for (const float n : mesh->normals) {
      if (!std::isfinite(n) || n != 0.0f) {
        std::cerr << "Degenerate triangle normal is not the zero vector.\n";
        return 5;
      }
    }
  }

  // Degeneracy does not depend on scale: a 0.1 micron right triangle still has a +Z normal.
  {
    bool degenerate = true;
    const std::array<float, 3> normal = mineviz::core::compute_face_normal(
      {0.0, 0.0, 0.0}, {1.0e-7, 0.0, 0.0}, {0.0, 1.0e-7, 0.0}, &degenerate);
    if (degenerate || !near(normal[2], 1.0f)) {
      std::cerr << "Tiny valid triangle was flagged degenerate.\n";
      return 14;
    }
    const std::array<float, 3> far_normal = mineviz::core::compute_face_normal(
      {500000.0, 7000000.0, 100.0}, {500000.0 + 1.0e-3, 7000000.0, 100.0},
      {500000.0, 7000000.0 + 1.0e-3, 100.0}, &degenerate);
    if (degenerate || !near(far_normal[2], 1.0f, 1.0e-3f)) {
      std::cerr << "Millimetre triangle at survey coordinates was flagged degenerate.\n";
      return 15;
    }
  }

  // Sloped triangle: normal (0,-1,1)/sqrt(2), colors span the terrain ramp by elevation.
  {
    Surface surface;
    surface.name = "pit_floor";
    surface.surface_type = "terrain";
    surface.vertices = {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {0.0, 10.0, 10.0}};
    surface.triangles = {{0, 1, 2}};
    const auto mesh = mineviz::core::build_surface_mesh(surface);
    if (!mesh.has_value() || mesh->ramp != ColorRamp::kTerrain || mesh->scalar_min != 0.0 ||
        mesh->scalar_max != 10.0) {
      std::cerr << "Sloped triangle mesh has unexpected ramp or scalar range.\n";
      return 6;
    }
    const float h = 1.0f / std::sqrt(2.0f);
    if (!near(mesh->normals[0], 0.0f) || !near(mesh->normals[1], -h) ||
        !near(mesh->normals[2], h)) {
      std::cerr << "Sloped triangle normal mismatch.\n";
      return 7;
    }
    const auto& terrain = mineviz::core::ramp_control_colors(ColorRamp::kTerrain);
    if (!same_color_at(mesh->colors, 0, terrain.front()) ||
        !same_color_at(mesh->colors, 1, terrain.front()) ||
        !same_color_at(mesh->colors, 2, terrain.back())) {
      std::cerr << "Elevation colors do not span the terrain ramp.\n";
      return 8;
    }
  }

  // Nothing to draw.
  {
    Surface empty;
    if (mineviz::core::build_surface_mesh(empty).has_value()) {
      std::cerr << "Empty surface produced a mesh.\n";
      return 9;
    }
    Surface no_triangles;
    no_triangles.vertices = {{0.0, 0.0, 0.0}};
    if (mineviz::core::build_surface_mesh(no_triangles).has_value()) {
      std::cerr << "Surface without triangles produced a mesh.\n";
      return 10;
    }
  }

  // Ramp resolution from surface type, with explicit overrides winning.
  if (mineviz::core::resolve_surface_ramp("coal_seam_roof") != ColorRamp::kSeam ||
      mineviz::core::resolve_surface_ramp("pit_design") != ColorRamp::kDesign ||
      mineviz::core::resolve_surface_ramp("terrain") != ColorRamp::kTerrain ||
      mineviz::core::resolve_surface_ramp("seam", ColorRamp::kThermal) != ColorRamp::kThermal) {
    std::cerr << "Surface ramp resolution mismatch.\n";
    return 11;
  }

  // A per-vertex quality field colors against its own range.
  {
    Surface surface;
    surface.vertices = {{0.0, 0.0, 50.0}, {1.0, 0.0, 50.0}, {0.0, 1.0, 50.0}};
    surface.triangles = {{0, 1, 2}};
    mineviz::core::ColorFieldSpec field;
    field.ramp_override = ColorRamp::kCoal;
    field.vertex_values = {20.0, 25.0, 30.0};
    const auto mesh = mineviz::core::build_surface_mesh(surface, field);
    const auto& coal = mineviz::core::ramp_control_colors(ColorRamp::kCoal);
    if (!mesh.has_value() || mesh->scalar_min != 20.0 || mesh->scalar_max != 30.0 ||
        !same_color_at(mesh->colors, 0, coal.front()) ||
        !same_color_at(mesh->colors, 1, coal[2]) || !same_color_at(mesh->colors, 2, coal.back())) {
      std::cerr << "Vertex quality field was not used for coloring.\n";
      return 12;
    }
  }

  // Contour points pair into segments; a dangling point is dropped.
  {
    mineviz::core::ContourLine line;
    line.level = 100.0;
    line.points = {{0.0, 0.0, 100.0}, {1.0, 0.0, 100.0}, {2.0, 0.0, 100.0}};
    const auto segments = mineviz::core::build_contour_segments({line});
    if (segments.size() != 6 || !near(segments[3], 1.0f)) {
      std::cerr << "Contour segments were not paired.\n";
      return 13;
    }
  }

  // VTU output keeps sub-metre survey coordinates.
  {
    Surface surface;
    surface.vertices = {{500123.25, 7000456.5, 101.75},
                        {500133.25, 7000456.5, 102.0},
                        {500123.25, 7000466.5, 103.0}};
    surface.triangles = {{0, 1, 2}};
    const auto mesh = mineviz::core::build_surface_mesh(surface);
    const std::filesystem::path dir("out/tests/surface_mesh_vtu");
    std::filesystem::create_directories(dir);
    const std::filesystem::path path = dir / "survey.vtu";
    if (!mesh.has_value() || !mineviz::core::write_surface_mesh_vtu(path, *mesh)) {
      std::cerr << "Failed to write survey.vtu.\n";
      return 16;
    }
    std::ifstream in(path);
    std::ostringstream text;
    text << in.rdbuf();
    if (text.str().find("500123.25 7000456.5 101.75") == std::string::npos) {
      std::cerr << "VTU points lost precision.\n";
      return 17;
    }
  }

  return 0;
}

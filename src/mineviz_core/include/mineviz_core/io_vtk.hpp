#pragma once

#include "mineviz_core/surface/surface_mesh.hpp"

#include <filesystem>

namespace mineviz::core {
// Writes the unindexed surface mesh as a VTU triangle grid with per-point Normals and Colors.
bool write_surface_mesh_vtu(const std::filesystem::path& output_path, const RenderableMesh& mesh);
}  // namespace mineviz::core

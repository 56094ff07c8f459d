#include "mineviz_core/io_vtk.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <vector>

namespace mineviz::core {
namespace {
void write_float_array(std::ofstream& out, const char* name, const std::vector<float>& values) {
  out << "        <DataArray type=\"Float32\"";
  if (name != nullptr) {
    out << " Name=\"" << name << "\"";
  }
  out << " NumberOfComponents=\"3\" format=\"ascii\">\n";
  for (std::size_t i = 0; i + 2 < values.size(); i += 3) {
    out << "          " << values[i] << " " << values[i + 1] << " " << values[i + 2] << "\n";
  }
  out << "        </DataArray>\n";
}
}  // namespace

bool write_surface_mesh_vtu(const std::filesystem::path& output_path, const RenderableMesh& mesh) {
  std::ofstream out(output_path, std::ios::trunc);
  if (!out) {
    return false;
  }

  // Round-trip float precision.
  out << std::setprecision(std::numeric_limits<float>::max_digits10);

  const std::size_t num_points = mesh.positions.size() / 3;
  const std::size_t num_cells = num_points / 3;

  out << "<?xml version=\"1.0\"?>\n";
  out << "<VTKFile type=\"UnstructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
  out << "  <UnstructuredGrid>\n";
  out << "    <Piece NumberOfPoints=\"" << num_points << "\" NumberOfCells=\"" << num_cells
      << "\">\n";
  out << "      <Points>\n";
  write_float_array(out, nullptr, mesh.positions);
  out << "      </Points>\n";
  out << "      <Cells>\n";
  out << "        <DataArray type=\"Int32\" Name=\"connectivity\" format=\"ascii\">\n";
  for (std::size_t c = 0; c < num_cells; ++c) {
    out << "          " << 3 * c << " " << 3 * c + 1 << " " << 3 * c + 2 << "\n";
  }
  out << "        </DataArray>\n";
  out << "        <DataArray type=\"Int32\" Name=\"offsets\" format=\"ascii\">\n";
  for (std::size_t c = 0; c < num_cells; ++c) {
    out << "          " << 3 * (c + 1) << "\n";
  }
  out << "        </DataArray>\n";
  out << "        <DataArray type=\"UInt8\" Name=\"types\" format=\"ascii\">\n";
  for (std::size_t c = 0; c < num_cells; ++c) {
    out << "          5\n";  // VTK_TRIANGLE
  }
  out << "        </DataArray>\n";
  out << "      </Cells>\n";
  out << "      <PointData Normals=\"Normals\" Scalars=\"Colors\">\n";
  write_float_array(out, "Normals", mesh.normals);
  write_float_array(out, "Colors", mesh.colors);
  out << "      </PointData>\n";
  out << "      <CellData/>\n";
  out << "    </Piece>\n";
  out << "  </UnstructuredGrid>\n";
  out << "</VTKFile>\n";

  return static_cast<bool>(out);
}
}  // namespace mineviz::core

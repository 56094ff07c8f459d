#include "mineviz_core/blocks/block_sectioner.hpp"
#include "mineviz_core/color/color_ramp.hpp"
#include "mineviz_core/flow/flow_layout.hpp"
#include "mineviz_core/pipeline.hpp"
#include "mineviz_core/profile/profile_view.hpp"
#include "mineviz_core/surface/surface_mesh.hpp"
#include "mineviz_core/version.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <array>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {
using BlockTuple = std::tuple<int, int, int, double, double, double, double>;
using ProfileTuple = std::pair<std::string, std::vector<std::pair<double, double>>>;
using FlowNodeTuple = std::pair<std::string, int>;
using FlowLinkTuple = std::tuple<std::string, std::string, std::string, double, int>;

py::dict bounds_to_dict(const mineviz::core::ProfileBounds& bounds) {
  py::dict result;
  result["min_distance"] = bounds.min_distance;
  result["max_distance"] = bounds.max_distance;
  result["min_z"] = bounds.min_z;
  result["max_z"] = bounds.max_z;
  return result;
}
}  // namespace

PYBIND11_MODULE(mineviz_core, m) {
  m.doc() = "pybind11 bindings for the mineviz spatial visualization core";

  m.def("version", []() { return mineviz::core::version(); }, "Return native core version string.");

  m.def(
    "color_at",
    [](const double value, const double vmin, const double vmax, const std::string& ramp) {
      const mineviz::core::Rgb c = mineviz::core::color_at(value, vmin, vmax, ramp);
      return std::array<float, 3> {c.r, c.g, c.b};
    },
    py::arg("value"), py::arg("min"), py::arg("max"), py::arg("ramp") = "viridis",
    "Map a scalar onto a named color ramp and return (r, g, b) in [0, 1].");

  m.def(
    "build_surface_mesh",
    [](const std::vector<std::array<double, 3>>& vertices,
       const std::vector<std::array<int, 3>>& triangles, const std::string& surface_type,
       const std::string& ramp) -> py::object {
      mineviz::core::Surface surface;
      surface.surface_type = surface_type;
      surface.vertices = vertices;
      surface.triangles = triangles;
      mineviz::core::ColorFieldSpec color_field;
      if (!ramp.empty()) {
        color_field.ramp_override = mineviz::core::parse_color_ramp(ramp);
      }
      const auto mesh = mineviz::core::build_surface_mesh(surface, color_field);
      if (!mesh.has_value()) {
        return py::none();
      }
      py::dict result;
      result["positions"] = mesh->positions;
      result["normals"] = mesh->normals;
      result["colors"] = mesh->colors;
      result["ramp"] = std::string(mineviz::core::color_ramp_name(mesh->ramp));
      result["scalar_min"] = mesh->scalar_min;
      result["scalar_max"] = mesh->scalar_max;
      result["triangle_count"] = mesh->triangle_count;
      result["skipped_triangle_count"] = mesh->skipped_triangle_count;
      result["degenerate_triangle_count"] = mesh->degenerate_triangle_count;
      return result;
    },
    py::arg("vertices"), py::arg("triangles"), py::arg("surface_type") = "terrain",
    py::arg("ramp") = "",
    "Triangulate a TIN into flat-shaded render buffers, or None when nothing is drawable.");

  m.def(
    "filter_by_section",
    [](const std::vector<BlockTuple>& blocks, const std::string& axis, const int level,
       const int tolerance) {
      std::vector<mineviz::core::Block> input;
      input.reserve(blocks.size());
      for (const auto& [i, j, k, x, y, z, value] : blocks) {
        mineviz::core::Block block;
        block.i = i;
        block.j = j;
        block.k = k;
        block.x = x;
        block.y = y;
        block.z = z;
        block.value = value;
        input.push_back(block);
      }
      mineviz::core::SectionFilter filter;
      filter.axis = mineviz::core::parse_section_axis(axis);
      filter.level = level;
      filter.tolerance = tolerance;
      std::vector<BlockTuple> output;
      for (const auto& block : mineviz::core::filter_by_section(input, filter)) {
        output.emplace_back(block.i, block.j, block.k, block.x, block.y, block.z, block.value);
      }
      return output;
    },
    py::arg("blocks"), py::arg("axis"), py::arg("level"), py::arg("tolerance") = 0,
    "Keep blocks (i, j, k, x, y, z, value) whose grid index on axis matches level.");

  m.def(
    "compute_profile_bounds",
    [](const std::vector<ProfileTuple>& profiles) -> py::object {
      std::vector<mineviz::core::Profile> input;
      for (const auto& [name, points] : profiles) {
        mineviz::core::Profile profile;
        profile.name = name;
        for (const auto& [distance, z] : points) {
          profile.points.push_back({distance, z});
        }
        input.push_back(profile);
      }
      const auto bounds = mineviz::core::compute_profile_bounds(input);
      if (!bounds.has_value()) {
        return py::none();
      }
      return bounds_to_dict(*bounds);
    },
    py::arg("profiles"), "Padded data bounds over [(name, [(distance, z), ...]), ...].");

  m.def(
    "layout_flow_graph",
    [](const std::vector<FlowNodeTuple>& nodes, const std::vector<FlowLinkTuple>& links,
       const std::string& material_filter) {
      std::vector<mineviz::core::FlowNode> node_input;
      for (const auto& [name, column] : nodes) {
        mineviz::core::FlowNode node;
        node.name = name;
        node.column = column;
        node_input.push_back(node);
      }
      std::vector<mineviz::core::FlowLink> link_input;
      for (const auto& [source, target, material, tonnes, loads] : links) {
        link_input.push_back({source, target, material, tonnes, loads});
      }
      const mineviz::core::FlowLayout layout =
        mineviz::core::layout_flow_graph(node_input, link_input, material_filter);

      py::list node_list;
      for (const auto& node : layout.nodes) {
        py::dict item;
        item["name"] = node.name;
        item["column"] = node.column;
        item["row"] = node.row;
        item["x"] = node.x;
        item["y"] = node.y;
        item["width"] = node.width;
        item["height"] = node.height;
        item["inflow_tonnes"] = node.inflow_tonnes;
        item["outflow_tonnes"] = node.outflow_tonnes;
        node_list.append(item);
      }
      py::list link_list;
      for (const auto& link : layout.links) {
        py::dict item;
        item["source"] = link.source;
        item["target"] = link.target;
        item["material"] = link.material;
        item["tonnes"] = link.tonnes;
        item["loads"] = link.loads;
        item["thickness"] = link.thickness;
        const mineviz::core::LinkPath& p = link.path;
        item["path"] = std::vector<std::pair<double, double>> {
          {p.p0.x, p.p0.y}, {p.c1.x, p.c1.y}, {p.c2.x, p.c2.y}, {p.p3.x, p.p3.y}};
        item["color"] = std::array<float, 4> {link.color.r, link.color.g, link.color.b,
                                              link.color.a};
        link_list.append(item);
      }
      py::dict result;
      result["nodes"] = node_list;
      result["links"] = link_list;
      result["max_tonnes"] = layout.max_tonnes;
      result["total_tonnes"] = layout.summary.total_tonnes;
      result["dropped_link_count"] = layout.summary.dropped_link_count;
      result["materials"] = layout.summary.materials;
      return result;
    },
    py::arg("nodes"), py::arg("links"), py::arg("material_filter") = mineviz::core::kAllMaterials,
    "Lay out a column Sankey from (name, column) nodes and "
    "(source, target, material, tonnes, loads) links.");

  m.def(
    "run_case",
    [](const std::string& case_path, const std::string& out_dir) {
      const mineviz::core::RunSummary summary = mineviz::core::run_case(case_path, out_dir);
      py::dict result;
      result["status"] = summary.status;
      result["case_type"] = summary.case_type;
      result["run_log"] = summary.run_log;
      result["surface_triangles"] = summary.surface_triangles;
      result["skipped_triangles"] = summary.skipped_triangles;
      result["degenerate_triangles"] = summary.degenerate_triangles;
      result["blocks_total"] = summary.blocks_total;
      result["blocks_visible"] = summary.blocks_visible;
      result["profile_count"] = summary.profile_count;
      result["grid_lines_x"] = summary.grid_lines_x;
      result["grid_lines_y"] = summary.grid_lines_y;
      result["probe_hit"] = summary.probe_hit;
      result["flow_links"] = summary.flow_links;
      result["flow_dropped_links"] = summary.flow_dropped_links;
      result["flow_total_tonnes"] = summary.flow_total_tonnes;
      std::vector<std::string> outputs;
      for (const auto& path : summary.outputs) {
        outputs.push_back(path.string());
      }
      result["outputs"] = outputs;
      return result;
    },
    py::arg("case_path"), py::arg("out_dir"),
    "Run a native case file and generate VTU/CSV outputs.");
}

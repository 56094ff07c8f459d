#include "mineviz_core/pipeline.hpp"

#include "mineviz_core/blocks/block_sectioner.hpp"
#include "mineviz_core/case_config.hpp"
#include "mineviz_core/demo_data.hpp"
#include "mineviz_core/flow/flow_layout.hpp"
#include "mineviz_core/io_vtk.hpp"
#include "mineviz_core/profile/profile_view.hpp"
#include "mineviz_core/surface/mesh_cache.hpp"
#include "mineviz_core/version.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mineviz::core {
namespace {
bool stage_enabled(const std::string& case_type, const char* stage) {
  return case_type == "all" || case_type == stage;
}

bool is_known_case_type(const std::string& case_type) {
  return case_type == "all" || case_type == "surface" || case_type == "blocks" ||
         case_type == "profile" || case_type == "flow";
}

std::ofstream open_output(const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open " + path.filename().string() + ".");
  }
  return out;
}

void run_surface_stage(const CaseKv& kv, const VizConfig& config,
                       const std::filesystem::path& output_dir, RunSummary* summary,
                       std::ostream& log) {
  const int nx = get_int(kv, "grid_nx", 40);
  const int ny = get_int(kv, "grid_ny", 40);
  const double spacing = get_double(kv, "grid_spacing", 5.0);
  if (nx <= 0 || ny <= 0 || spacing <= 0.0) {
    throw std::invalid_argument("Surface grid_nx, grid_ny and grid_spacing must be positive.");
  }
  const int render_passes = std::max(get_int(kv, "render_passes", 1), 1);

  const Surface surface = make_demo_surface(nx, ny, spacing, get_string(kv, "surface_type",
                                                                        "terrain"));
  ColorFieldSpec color_field;
  if (has_key(kv, "surface_ramp")) {
    color_field.ramp_override = parse_color_ramp(get_string(kv, "surface_ramp", "terrain"));
  }

  SurfaceMeshCache cache(config.mesh_cache_capacity);
  std::shared_ptr<const RenderableMesh> mesh;
  for (int pass = 0; pass < render_passes; ++pass) {
    mesh = cache.get_or_build(surface, color_field);
  }

  log << "surface_name=" << surface.name << "\n";
  log << "surface_vertices=" << surface.vertices.size() << "\n";
  log << "mesh_cache_hits=" << cache.hits() << "\n";
  log << "mesh_cache_misses=" << cache.misses() << "\n";
  if (!mesh) {
    log << "surface_mesh=empty\n";
    return;
  }

  summary->surface_triangles = mesh->triangle_count;
  summary->skipped_triangles = mesh->skipped_triangle_count;
  summary->degenerate_triangles = mesh->degenerate_triangle_count;
  log << "surface_ramp=" << color_ramp_name(mesh->ramp) << "\n";
  log << "surface_triangles=" << mesh->triangle_count << "\n";
  log << "surface_skipped_triangles=" << mesh->skipped_triangle_count << "\n";
  log << "surface_degenerate_triangles=" << mesh->degenerate_triangle_count << "\n";
  log << "surface_z_range=" << mesh->scalar_min << "," << mesh->scalar_max << "\n";
  if (mesh->degenerate_triangle_count > 0) {
    std::cerr << "warning: " << mesh->degenerate_triangle_count
              << " degenerate triangles rendered with zero normals\n";
  }

  const std::filesystem::path vtu_path = output_dir / "surface_mesh.vtu";
  if (!write_surface_mesh_vtu(vtu_path, *mesh)) {
    throw std::runtime_error("Failed to write surface_mesh.vtu.");
  }
  summary->outputs.push_back(vtu_path);
}

void run_blocks_stage(const CaseKv& kv, const VizConfig& config,
                      const std::filesystem::path& output_dir, RunSummary* summary,
                      std::ostream& log) {
  BlockModelDefinition definition;
  definition.count_x = get_int(kv, "block_nx", 10);
  definition.count_y = get_int(kv, "block_ny", 10);
  definition.count_z = get_int(kv, "block_nz", 5);
  definition.block_size_x = get_double(kv, "block_size_x", definition.block_size_x);
  definition.block_size_y = get_double(kv, "block_size_y", definition.block_size_y);
  definition.block_size_z = get_double(kv, "block_size_z", definition.block_size_z);
  if (definition.count_x <= 0 || definition.count_y <= 0 || definition.count_z <= 0) {
    throw std::invalid_argument("Block counts must be positive.");
  }

  const std::vector<Block> blocks = make_demo_blocks(
    definition, get_double(kv, "block_origin_x", 500000.0),
    get_double(kv, "block_origin_y", 7000000.0), get_double(kv, "block_origin_z", 0.0));
  const Vec3 offset = compute_block_offset(blocks, get_on_off(kv, "auto_center", true));
  const GridLevels levels = compute_max_levels(blocks, &definition);

  SectionFilter filter;
  filter.axis = parse_section_axis(get_string(kv, "section_axis", "none"));
  filter.level = get_int(kv, "section_level", 0);
  filter.tolerance = get_int(kv, "section_tolerance", 0);
  filter = clamp_section_level(filter, levels);
  const std::vector<Block> visible = filter_by_section(blocks, filter);

  const std::string quality_field = get_string(kv, "quality_field", "cv");
  double value_min = std::numeric_limits<double>::infinity();
  double value_max = -std::numeric_limits<double>::infinity();
  for (const auto& block : visible) {
    value_min = std::min(value_min, block_value(block, quality_field));
    value_max = std::max(value_max, block_value(block, quality_field));
  }
  value_min = get_double(kv, "value_min", visible.empty() ? 0.0 : value_min);
  value_max = get_double(kv, "value_max", visible.empty() ? 0.0 : value_max);

  const BlockInstanceBuffer instances = build_block_instances(
    visible, offset, value_min, value_max, config.default_ramp, quality_field, &definition);

  summary->blocks_total = static_cast<int>(blocks.size());
  summary->blocks_visible = static_cast<int>(visible.size());
  log << "blocks_total=" << blocks.size() << "\n";
  log << "blocks_visible=" << visible.size() << "\n";
  log << "block_offset=" << offset.x << "," << offset.y << "," << offset.z << "\n";
  log << "block_levels=" << levels.x << "," << levels.y << "," << levels.z << "\n";
  log << "section_axis=" << section_axis_name(filter.axis) << "\n";
  log << "section_level=" << filter.level << "\n";
  log << "block_ramp=" << color_ramp_name(config.default_ramp) << "\n";

  const std::filesystem::path csv_path = output_dir / "block_section.csv";
  std::ofstream csv = open_output(csv_path);
  csv << "block_id,i,j,k,value,render_x,render_y,render_z,r,g,b\n";
  for (std::size_t b = 0; b < visible.size(); ++b) {
    const Block& block = visible[b];
    csv << block.block_id << "," << block.i << "," << block.j << "," << block.k << ","
        << block_value(block, quality_field) << "," << instances.translations[3 * b + 0] << ","
        << instances.translations[3 * b + 1] << "," << instances.translations[3 * b + 2] << ","
        << instances.colors[3 * b + 0] << "," << instances.colors[3 * b + 1] << ","
        << instances.colors[3 * b + 2] << "\n";
  }
  summary->outputs.push_back(csv_path);
}

void run_profile_stage(const CaseKv& kv, const VizConfig& config,
                       const std::filesystem::path& output_dir, RunSummary* summary,
                       std::ostream& log) {
  const double length = get_double(kv, "profile_length", 400.0);
  const double spacing = get_double(kv, "profile_spacing", 5.0);
  if (length < 0.0 || spacing <= 0.0) {
    throw std::invalid_argument("profile_length must be non-negative and profile_spacing "
                                "positive.");
  }
  if (length / spacing > static_cast<double>(kMaxDemoProfilePoints)) {
    throw std::invalid_argument("profile_length / profile_spacing exceeds " +
                                std::to_string(kMaxDemoProfilePoints) + " points.");
  }

  const std::vector<Profile> profiles = make_demo_profiles(length, spacing);
  summary->profile_count = static_cast<int>(profiles.size());

  const std::optional<ProfileBounds> bounds = compute_profile_bounds(profiles, config.profile);
  if (!bounds.has_value()) {
    log << "profile_bounds=empty\n";
    return;
  }

  ProfileViewTransform view(*bounds, config.viewport_width, config.viewport_height,
                            config.profile);
  view.set_zoom(get_double(kv, "zoom", 1.0));
  view.set_pan_offset({get_double(kv, "pan_x", 0.0), get_double(kv, "pan_y", 0.0)});

  const GridLines grid = view.generate_grid_lines();
  summary->grid_lines_x = static_cast<int>(grid.x.size());
  summary->grid_lines_y = static_cast<int>(grid.y.size());
  log << "profile_bounds=" << bounds->min_distance << "," << bounds->max_distance << ","
      << bounds->min_z << "," << bounds->max_z << "\n";
  log << "profile_zoom=" << view.zoom() << "\n";
  log << "grid_interval=" << grid.x_interval << "," << grid.y_interval << "\n";
  for (const auto& profile : profiles) {
    const ProfileStats stats = compute_profile_stats(profile);
    log << "profile=" << profile.name << " points=" << stats.point_count
        << " length=" << stats.length << " min_z=" << stats.min_elevation
        << " max_z=" << stats.max_elevation << "\n";
  }

  const double probe_x = get_double(kv, "probe_x", 0.5 * config.viewport_width);
  const double probe_y = get_double(kv, "probe_y", 0.5 * config.viewport_height);
  const std::optional<ProbeHit> hit = view.nearest_point(profiles, probe_x, probe_y);
  summary->probe_hit = hit.has_value();
  if (hit.has_value()) {
    log << "probe=" << hit->profile_name << " distance=" << hit->point.distance
        << " z=" << hit->point.z << "\n";
  } else {
    log << "probe=none\n";
  }

  const std::filesystem::path csv_path = output_dir / "profile_grid.csv";
  std::ofstream csv = open_output(csv_path);
  csv << "axis,value,screen,major\n";
  for (const auto& line : grid.x) {
    csv << "x," << line.value << "," << line.screen << "," << (line.major ? 1 : 0) << "\n";
  }
  for (const auto& line : grid.y) {
    csv << "y," << line.value << "," << line.screen << "," << (line.major ? 1 : 0) << "\n";
  }
  summary->outputs.push_back(csv_path);
}

void run_flow_stage(const CaseKv& kv, const VizConfig& config,
                    const std::filesystem::path& output_dir, RunSummary* summary,
                    std::ostream& log) {
  const std::string material_filter = get_string(kv, "material_filter", kAllMaterials);
  const FlowLayout layout = layout_flow_graph(make_demo_flow_nodes(), make_demo_flow_links(),
                                              material_filter, config.flow);

  summary->flow_links = layout.summary.link_count;
  summary->flow_dropped_links = layout.summary.dropped_link_count;
  summary->flow_total_tonnes = layout.summary.total_tonnes;
  log << "material_filter=" << material_filter << "\n";
  log << "flow_links=" << layout.summary.link_count << "\n";
  log << "flow_total_tonnes=" << layout.summary.total_tonnes << "\n";
  log << "flow_total_loads=" << layout.summary.total_loads << "\n";
  log << "flow_max_tonnes=" << layout.max_tonnes << "\n";
  if (layout.summary.dropped_link_count > 0) {
    std::cerr << "warning: dropped " << layout.summary.dropped_link_count
              << " flow links with unknown endpoints\n";
  }

  const std::filesystem::path nodes_path = output_dir / "flow_nodes.csv";
  std::ofstream nodes_csv = open_output(nodes_path);
  nodes_csv << "name,column,row,x,y,width,height,inflow,outflow\n";
  for (const auto& node : layout.nodes) {
    nodes_csv << node.name << "," << node.column << "," << node.row << "," << node.x << ","
              << node.y << "," << node.width << "," << node.height << "," << node.inflow_tonnes
              << "," << node.outflow_tonnes << "\n";
  }

  const std::filesystem::path links_path = output_dir / "flow_links.csv";
  std::ofstream links_csv = open_output(links_path);
  links_csv << "source,target,material,tonnes,loads,thickness,x0,y0,c1x,c1y,c2x,c2y,x1,y1\n";
  for (const auto& link : layout.links) {
    const LinkPath& p = link.path;
    links_csv << link.source << "," << link.target << "," << link.material << ","
              << link.tonnes << "," << link.loads << "," << link.thickness << "," << p.p0.x
              << "," << p.p0.y << "," << p.c1.x << "," << p.c1.y << "," << p.c2.x << ","
              << p.c2.y << "," << p.p3.x << "," << p.p3.y << "\n";
  }
  summary->outputs.push_back(nodes_path);
  summary->outputs.push_back(links_path);
}
}  // namespace

RunSummary run_case(const std::string& case_path, const std::string& out_dir) {
  if (!std::filesystem::exists(case_path)) {
    throw std::invalid_argument("Case file not found: " + case_path);
  }
  const std::filesystem::path output_dir(out_dir.empty() ? "." : out_dir);
  std::filesystem::create_directories(output_dir);

  const CaseKv kv = parse_case_kv(case_path);
  const std::string case_type = to_lower_copy(get_string(kv, "case_type", "all"));
  if (!is_known_case_type(case_type)) {
    throw std::invalid_argument("Unsupported case_type '" + case_type +
                                "'. Use surface, blocks, profile, flow or all.");
  }
  const VizConfig config = load_viz_config(kv);
  validate_viz_config(config);

  RunSummary summary;
  summary.case_type = case_type;

  std::ostringstream log;
  log << "mineviz visualization case\n";
  log << "version=" << version() << "\n";
  log << "case_path=" << case_path << "\n";
  log << "case_type=" << case_type << "\n";
  log << "viewport=" << config.viewport_width << "x" << config.viewport_height << "\n";

  if (stage_enabled(case_type, "surface")) {
    run_surface_stage(kv, config, output_dir, &summary, log);
  }
  if (stage_enabled(case_type, "blocks")) {
    run_blocks_stage(kv, config, output_dir, &summary, log);
  }
  if (stage_enabled(case_type, "profile")) {
    run_profile_stage(kv, config, output_dir, &summary, log);
  }
  if (stage_enabled(case_type, "flow")) {
    run_flow_stage(kv, config, output_dir, &summary, log);
  }

  const std::filesystem::path run_log_path = output_dir / "run.log";
  {
    std::ofstream run_log = open_output(run_log_path);
    run_log << log.str();
    run_log << "status=ok\n";
  }

  summary.status = "ok";
  summary.run_log = run_log_path.string();
  return summary;
}
}  // namespace mineviz::core

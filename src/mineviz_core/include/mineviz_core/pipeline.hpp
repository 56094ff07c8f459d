#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mineviz::core {
struct RunSummary {
  std::string status;
  std::string case_type;
  std::string run_log;
  int surface_triangles = 0;
  int skipped_triangles = 0;
  int degenerate_triangles = 0;
  int blocks_total = 0;
  int blocks_visible = 0;
  int profile_count = 0;
  int grid_lines_x = 0;
  int grid_lines_y = 0;
  bool probe_hit = false;
  int flow_links = 0;
  int flow_dropped_links = 0;
  double flow_total_tonnes = 0.0;
  std::vector<std::filesystem::path> outputs;
};

// Runs the demo visualization case described by a key=value case file and writes its outputs
// plus run.log into out_dir. case_type is one of surface, blocks, profile, flow or all.
RunSummary run_case(const std::string& case_path, const std::string& out_dir);
}  // namespace mineviz::core

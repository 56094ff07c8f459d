#include "mineviz_core/profile/profile_view.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

namespace {
bool near(const double a, const double b, const double tol) {
  return std::abs(a - b) <= tol;
}

mineviz::core::Profile make_line(const char* name, const double z0, const double slope) {
  mineviz::core::Profile profile;
  profile.name = name;
  for (int i = 0; i <= 20; ++i) {
    const double d = 10.0 * i;
    profile.points.push_back({d, z0 + slope * d});
  }
  return profile;
}
}  // namespace

int main() {
  using mineviz::core::ProfileBounds;
  using mineviz::core::ProfileViewTransform;

  // Screen round trip holds for every zoom level with pan applied.
  {
    const ProfileBounds bounds {-35.0, 1240.0, 52.5, 187.0};
    ProfileViewTransform view(bounds, 600.0, 300.0);
    std::mt19937 rng(12345);
    std::uniform_real_distribution<double> dist_d(bounds.min_distance, bounds.max_distance);
    std::uniform_real_distribution<double> dist_z(bounds.min_z, bounds.max_z);
    std::uniform_real_distribution<double> dist_pan(-200.0, 200.0);
    for (const double zoom : {0.5, 1.0, 3.0, 10.0}) {
      view.set_zoom(zoom);
      for (int i = 0; i < 1000; ++i) {
        view.set_pan_offset({dist_pan(rng), dist_pan(rng)});
        const double d = dist_d(rng);
        const double z = dist_z(rng);
        const mineviz::core::ScreenPoint s = view.to_screen(d, z);
        const mineviz::core::ProfilePoint back = view.from_screen(s.x, s.y);
        if (!near(back.distance, d, 1.0e-6) || !near(back.z, z, 1.0e-6)) {
          std::cerr << "Round trip failed at zoom " << zoom << ": (" << d << "," << z
                    << ") -> (" << back.distance << "," << back.z << ")\n";
          return 1;
        }
      }
    }
  }

  // Axis orientation: min distance at the left pad, min elevation at the bottom pad.
  {
    const ProfileBounds bounds {0.0, 100.0, 0.0, 50.0};
    ProfileViewTransform view(bounds, 600.0, 300.0);
    const auto origin = view.to_screen(0.0, 0.0);
    const auto corner = view.to_screen(100.0, 50.0);
    if (!near(origin.x, 50.0, 1.0e-9) || !near(origin.y, 250.0, 1.0e-9) ||
        !near(corner.x, 550.0, 1.0e-9) || !near(corner.y, 50.0, 1.0e-9)) {
      std::cerr << "Plot area does not fill the padded viewport.\n";
      return 2;
    }
    mineviz::core::Profile diagonal;
    diagonal.points = {{0.0, 0.0}, {50.0, 25.0}, {100.0, 50.0}};
    const auto path = view.build_profile_path(diagonal);
    if (path.size() != 3 || !near(path[1].x, 300.0, 1.0e-9) || !near(path[1].y, 150.0, 1.0e-9)) {
      std::cerr << "Profile path is not in screen space.\n";
      return 2;
    }
  }

  // Distance range [0, 100] gives interval 10 with majors at 0, 50 and 100.
  {
    const ProfileBounds bounds {0.0, 100.0, 0.0, 100.0};
    const ProfileViewTransform view(bounds, 600.0, 300.0);
    const mineviz::core::GridLines grid = view.generate_grid_lines();
    if (!near(grid.x_interval, 10.0, 1.0e-12) || grid.x.size() != 11) {
      std::cerr << "Expected 11 vertical grid lines at interval 10, got " << grid.x.size()
                << " at " << grid.x_interval << "\n";
      return 3;
    }
    std::vector<double> majors;
    for (const auto& line : grid.x) {
      if (line.major) {
        majors.push_back(line.value);
      }
    }
    if (majors.size() != 3 || majors[0] != 0.0 || majors[1] != 50.0 || majors[2] != 100.0) {
      std::cerr << "Major grid lines are not at 0, 50 and 100.\n";
      return 4;
    }
    if (!near(mineviz::core::nice_grid_interval(1275.0, 5.0), 100.0, 1.0e-9) ||
        mineviz::core::nice_grid_interval(0.0, 5.0) != 0.0) {
      std::cerr << "nice_grid_interval mismatch.\n";
      return 5;
    }
  }

  // Zoomed-in grids only keep lines inside the plot area.
  {
    const ProfileBounds bounds {0.0, 100.0, 0.0, 100.0};
    ProfileViewTransform view(bounds, 600.0, 300.0);
    view.set_zoom(4.0);
    const auto grid = view.generate_grid_lines();
    for (const auto& line : grid.x) {
      if (line.screen < 50.0 - 1.0e-6 || line.screen > 550.0 + 1.0e-6) {
        std::cerr << "Grid line outside the plot area.\n";
        return 6;
      }
    }
    if (grid.x.size() >= 11) {
      std::cerr << "Zoomed grid kept off-screen lines.\n";
      return 7;
    }
  }

  // Line count stays bounded however fine the divisions are.
  {
    mineviz::core::ProfileViewConfig dense;
    dense.grid_divisions = 1.0e6;
    const ProfileViewTransform view({0.0, 100.0, 0.0, 100.0}, 600.0, 300.0, dense);
    const auto grid = view.generate_grid_lines();
    if (!grid.x.empty() || !grid.y.empty()) {
      std::cerr << "Grid with a million divisions was not capped.\n";
      return 18;
    }
    mineviz::core::ProfileViewConfig finest;
    finest.grid_divisions = 100.0;
    const ProfileViewTransform fine_view({0.0, 100.0, 0.0, 100.0}, 600.0, 300.0, finest);
    if (fine_view.generate_grid_lines().x.size() != 101) {
      std::cerr << "Grid at 100 divisions lost lines.\n";
      return 19;
    }
  }

  // Bounds padding, with fallbacks for flat profiles.
  {
    const std::vector<mineviz::core::Profile> profiles = {make_line("ground", 100.0, 0.25)};
    const auto bounds = mineviz::core::compute_profile_bounds(profiles);
    if (!bounds.has_value() || !near(bounds->min_distance, -10.0, 1.0e-9) ||
        !near(bounds->max_distance, 210.0, 1.0e-9) || !near(bounds->min_z, 95.0, 1.0e-9) ||
        !near(bounds->max_z, 155.0, 1.0e-9)) {
      std::cerr << "Padded profile bounds mismatch.\n";
      return 8;
    }

    mineviz::core::Profile flat;
    flat.points = {{0.0, 80.0}};
    const auto flat_bounds = mineviz::core::compute_profile_bounds({flat});
    if (!flat_bounds.has_value() || !near(flat_bounds->min_distance, -10.0, 1.0e-9) ||
        !near(flat_bounds->max_z, 85.0, 1.0e-9)) {
      std::cerr << "Zero-range bounds did not use fallback padding.\n";
      return 9;
    }

    if (mineviz::core::compute_profile_bounds({mineviz::core::Profile {}}).has_value()) {
      std::cerr << "Empty profiles produced bounds.\n";
      return 10;
    }
  }

  // Nearest point by distance, rejected beyond the cutoff.
  {
    const std::vector<mineviz::core::Profile> profiles = {make_line("ground", 100.0, 0.25),
                                                          make_line("design", 85.0, 0.0)};
    const auto bounds = mineviz::core::compute_profile_bounds(profiles);
    const ProfileViewTransform view(*bounds, 600.0, 300.0);
    const auto cursor = view.to_screen(71.0, 90.0);
    const auto hit = view.nearest_point(profiles, cursor.x, cursor.y);
    if (!hit.has_value() || hit->point.distance != 70.0 || hit->profile_index != 0 ||
        hit->point_index != 7 || hit->profile_name != "ground") {
      std::cerr << "Nearest point lookup mismatch.\n";
      return 11;
    }
    // Far past the end of the section: no hit.
    const auto far = view.to_screen(400.0, 90.0);
    if (view.nearest_point(profiles, far.x, far.y).has_value()) {
      std::cerr << "Probe beyond the cutoff returned a point.\n";
      return 12;
    }
  }

  // Zoom clamps and reset restores the identity view.
  {
    ProfileViewTransform view({0.0, 100.0, 0.0, 100.0}, 600.0, 300.0);
    view.set_zoom(50.0);
    if (view.zoom() != 10.0) {
      std::cerr << "Zoom was not clamped to the maximum.\n";
      return 13;
    }
    view.set_zoom(0.01);
    if (view.zoom() != 0.5) {
      std::cerr << "Zoom was not clamped to the minimum.\n";
      return 14;
    }
    view.set_zoom(1.0);
    view.zoom_in();
    if (!near(view.zoom(), 1.5, 1.0e-12)) {
      std::cerr << "zoom_in did not apply the zoom step.\n";
      return 15;
    }
    view.pan_pixels(10.0, -5.0);
    view.reset_view();
    if (view.zoom() != 1.0 || view.pan_offset().x != 0.0 || view.pan_offset().y != 0.0) {
      std::cerr << "reset_view did not restore zoom and pan.\n";
      return 16;
    }
  }

  // Profile statistics.
  {
    const auto stats = mineviz::core::compute_profile_stats(make_line("ramp", 0.0, 1.0));
    if (stats.point_count != 21 || !near(stats.length, 200.0, 1.0e-9) ||
        !near(stats.max_elevation, 200.0, 1.0e-9) || stats.slope_to_next_deg.size() != 20 ||
        !near(stats.slope_to_next_deg.front(), 45.0, 1.0e-9)) {
      std::cerr << "Profile stats mismatch.\n";
      return 17;
    }
  }

  return 0;
}

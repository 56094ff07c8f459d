#pragma once

#include "mineviz_core/geometry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mineviz::core {
struct ProfilePoint {
  double distance = 0.0;  // cumulative horizontal distance along the cut line
  double z = 0.0;
};

struct Profile {
  std::string name;
  std::vector<ProfilePoint> points;
};

struct ProfileBounds {
  double min_distance = 0.0;
  double max_distance = 0.0;
  double min_z = 0.0;
  double max_z = 0.0;
};

struct ProfileViewConfig {
  double padding_px = 50.0;
  double distance_pad_fraction = 0.05;
  double elevation_pad_fraction = 0.1;
  double distance_fallback_pad = 10.0;
  double elevation_fallback_pad = 5.0;
  double grid_divisions = 5.0;
  int major_every = 5;
  double nearest_cutoff_fraction = 0.05;
  double zoom_min = 0.5;
  double zoom_max = 10.0;
  double zoom_step = 1.5;
};

struct GridLine {
  double value = 0.0;
  double screen = 0.0;
  bool major = false;
};

struct GridLines {
  std::vector<GridLine> x;
  std::vector<GridLine> y;
  double x_interval = 0.0;
  double y_interval = 0.0;
};

struct ProbeHit {
  ProfilePoint point;
  int profile_index = -1;
  int point_index = -1;
  std::string profile_name;
  double distance_error = 0.0;
};

struct ProfileStats {
  int point_count = 0;
  double length = 0.0;
  double min_elevation = 0.0;
  double max_elevation = 0.0;
  std::vector<double> slope_to_next_deg;
};

// std::nullopt when no profile carries points.
std::optional<ProfileBounds> compute_profile_bounds(const std::vector<Profile>& profiles,
                                                    const ProfileViewConfig& config = {});

// Largest power of ten not exceeding range / divisions; 0 for an empty range.
double nice_grid_interval(double range, double divisions);

ProfileStats compute_profile_stats(const Profile& profile);

// Affine data <-> screen map for a section plot. Each axis keeps its own pixels-per-unit scale
// so the plot fills the padded viewport; zoom multiplies both and pan shifts in pixels.
class ProfileViewTransform {
 public:
  ProfileViewTransform(const ProfileBounds& bounds, double width, double height,
                       ProfileViewConfig config = {});

  ScreenPoint to_screen(double distance, double z) const;
  ProfilePoint from_screen(double x, double y) const;

  // An axis that would need more than 1000 lines gets none.
  GridLines generate_grid_lines() const;
  GridLines generate_grid_lines(const ProfileBounds& bounds) const;
  std::optional<ProbeHit> nearest_point(const std::vector<Profile>& profiles, double screen_x,
                                        double screen_y) const;
  std::vector<ScreenPoint> build_profile_path(const Profile& profile) const;

  void set_zoom(double zoom);
  void zoom_in();
  void zoom_out();
  void reset_view();
  void set_pan_offset(const ScreenPoint& pan_offset);
  void pan_pixels(double dx, double dy);

  double zoom() const { return zoom_; }
  ScreenPoint pan_offset() const { return pan_offset_; }
  const ProfileBounds& bounds() const { return bounds_; }
  const ProfileViewConfig& config() const { return config_; }
  double width() const { return width_; }
  double height() const { return height_; }
  double plot_width() const;
  double plot_height() const;

 private:
  double scale_x() const;
  double scale_y() const;

  ProfileBounds bounds_;
  double width_ = 600.0;
  double height_ = 300.0;
  ProfileViewConfig config_;
  double zoom_ = 1.0;
  ScreenPoint pan_offset_;
};
}  // namespace mineviz::core

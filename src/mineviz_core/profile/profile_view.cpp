#include "mineviz_core/profile/profile_view.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace mineviz::core {
namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kScreenEps = 1.0e-6;
constexpr double kIndexEps = 1.0e-9;
constexpr double kMinPlotPixels = 1.0;
constexpr double kMaxGridLinesPerAxis = 1000.0;

double pad_or_fallback(const double range, const double fraction, const double fallback) {
  const double pad = range * fraction;
  return pad > 0.0 ? pad : fallback;
}

template <typename ToScreen>
std::vector<GridLine> axis_grid_lines(const double min_value, const double max_value,
                                      const double interval, const int major_every,
                                      const double screen_lo, const double screen_hi,
                                      ToScreen to_screen) {
  std::vector<GridLine> lines;
  if (!(interval > 0.0) || !std::isfinite(interval)) {
    return lines;
  }

  const double first_multiple = std::ceil(min_value / interval - kIndexEps);
  const double last_multiple = std::floor(max_value / interval + kIndexEps);
  if (!std::isfinite(first_multiple) || !std::isfinite(last_multiple) ||
      !(last_multiple - first_multiple < kMaxGridLinesPerAxis)) {
    return lines;
  }
  const long long first = static_cast<long long>(first_multiple);
  const long long last = static_cast<long long>(last_multiple);
  const long long major_step = std::max(major_every, 1);
  for (long long n = first; n <= last; ++n) {
    GridLine line;
    line.value = static_cast<double>(n) * interval;
    line.screen = to_screen(line.value);
    if (line.screen < screen_lo - kScreenEps || line.screen > screen_hi + kScreenEps) {
      continue;
    }
    line.major = n % major_step == 0;
    lines.push_back(line);
  }
  return lines;
}
}  // namespace

std::optional<ProfileBounds> compute_profile_bounds(const std::vector<Profile>& profiles,
                                                    const ProfileViewConfig& config) {
  double min_distance = std::numeric_limits<double>::infinity();
  double max_distance = -std::numeric_limits<double>::infinity();
  double min_z = std::numeric_limits<double>::infinity();
  double max_z = -std::numeric_limits<double>::infinity();
  bool any_point = false;

  for (const auto& profile : profiles) {
    for (const auto& pt : profile.points) {
      min_distance = std::min(min_distance, pt.distance);
      max_distance = std::max(max_distance, pt.distance);
      min_z = std::min(min_z, pt.z);
      max_z = std::max(max_z, pt.z);
      any_point = true;
    }
  }
  if (!any_point) {
    return std::nullopt;
  }

  const double distance_pad = pad_or_fallback(max_distance - min_distance,
                                              config.distance_pad_fraction,
                                              config.distance_fallback_pad);
  const double z_pad = pad_or_fallback(max_z - min_z, config.elevation_pad_fraction,
                                       config.elevation_fallback_pad);
  return ProfileBounds{
    min_distance - distance_pad,
    max_distance + distance_pad,
    min_z - z_pad,
    max_z + z_pad,
  };
}

double nice_grid_interval(const double range, const double divisions) {
  if (!(range > 0.0) || !(divisions > 0.0) || !std::isfinite(range)) {
    return 0.0;
  }
  return std::pow(10.0, std::floor(std::log10(range / divisions)));
}

ProfileStats compute_profile_stats(const Profile& profile) {
  ProfileStats stats;
  stats.point_count = static_cast<int>(profile.points.size());
  if (profile.points.empty()) {
    return stats;
  }

  stats.length = profile.points.back().distance - profile.points.front().distance;
  stats.min_elevation = profile.points.front().z;
  stats.max_elevation = profile.points.front().z;
  stats.slope_to_next_deg.reserve(profile.points.size() - 1);
  for (std::size_t i = 0; i < profile.points.size(); ++i) {
    const ProfilePoint& pt = profile.points[i];
    stats.min_elevation = std::min(stats.min_elevation, pt.z);
    stats.max_elevation = std::max(stats.max_elevation, pt.z);
    if (i + 1 < profile.points.size()) {
      const ProfilePoint& next = profile.points[i + 1];
      stats.slope_to_next_deg.push_back(std::atan2(next.z - pt.z, next.distance - pt.distance) *
                                        180.0 / kPi);
    }
  }
  return stats;
}

ProfileViewTransform::ProfileViewTransform(const ProfileBounds& bounds, const double width,
                                           const double height, ProfileViewConfig config)
    : bounds_(bounds), width_(width), height_(height), config_(std::move(config)) {}

double ProfileViewTransform::plot_width() const {
  return std::max(width_ - 2.0 * config_.padding_px, kMinPlotPixels);
}

double ProfileViewTransform::plot_height() const {
  return std::max(height_ - 2.0 * config_.padding_px, kMinPlotPixels);
}

double ProfileViewTransform::scale_x() const {
  const double range = bounds_.max_distance - bounds_.min_distance;
  return plot_width() / (range > 0.0 ? range : 1.0);
}

double ProfileViewTransform::scale_y() const {
  const double range = bounds_.max_z - bounds_.min_z;
  return plot_height() / (range > 0.0 ? range : 1.0);
}

ScreenPoint ProfileViewTransform::to_screen(const double distance, const double z) const {
  return {
    config_.padding_px + (distance - bounds_.min_distance) * scale_x() * zoom_ + pan_offset_.x,
    height_ - config_.padding_px - (z - bounds_.min_z) * scale_y() * zoom_ + pan_offset_.y,
  };
}

ProfilePoint ProfileViewTransform::from_screen(const double x, const double y) const {
  return {
    (x - config_.padding_px - pan_offset_.x) / (scale_x() * zoom_) + bounds_.min_distance,
    bounds_.min_z + (height_ - config_.padding_px - y + pan_offset_.y) / (scale_y() * zoom_),
  };
}

GridLines ProfileViewTransform::generate_grid_lines() const {
  return generate_grid_lines(bounds_);
}

GridLines ProfileViewTransform::generate_grid_lines(const ProfileBounds& bounds) const {
  GridLines lines;
  lines.x_interval =
    nice_grid_interval(bounds.max_distance - bounds.min_distance, config_.grid_divisions);
  lines.y_interval = nice_grid_interval(bounds.max_z - bounds.min_z, config_.grid_divisions);

  const double left = config_.padding_px;
  const double right = width_ - config_.padding_px;
  const double top = config_.padding_px;
  const double bottom = height_ - config_.padding_px;

  lines.x = axis_grid_lines(bounds.min_distance, bounds.max_distance, lines.x_interval,
                            config_.major_every, left, right,
                            [this](const double d) { return to_screen(d, 0.0).x; });
  lines.y = axis_grid_lines(bounds.min_z, bounds.max_z, lines.y_interval, config_.major_every,
                            top, bottom, [this](const double z) { return to_screen(0.0, z).y; });
  return lines;
}

std::optional<ProbeHit> ProfileViewTransform::nearest_point(const std::vector<Profile>& profiles,
                                                            const double screen_x,
                                                            const double screen_y) const {
  const ProfilePoint cursor = from_screen(screen_x, screen_y);

  std::optional<ProbeHit> best;
  for (int p = 0; p < static_cast<int>(profiles.size()); ++p) {
    const Profile& profile = profiles[static_cast<std::size_t>(p)];
    for (int i = 0; i < static_cast<int>(profile.points.size()); ++i) {
      const ProfilePoint& pt = profile.points[static_cast<std::size_t>(i)];
      const double error = std::abs(pt.distance - cursor.distance);
      if (best.has_value() && !(error < best->distance_error)) {
        continue;
      }
      ProbeHit hit;
      hit.point = pt;
      hit.profile_index = p;
      hit.point_index = i;
      hit.profile_name = profile.name;
      hit.distance_error = error;
      best = std::move(hit);
    }
  }

  if (!best.has_value()) {
    return std::nullopt;
  }
  const double cutoff =
    (bounds_.max_distance - bounds_.min_distance) * config_.nearest_cutoff_fraction;
  if (!(best->distance_error < cutoff)) {
    return std::nullopt;
  }
  return best;
}

std::vector<ScreenPoint> ProfileViewTransform::build_profile_path(const Profile& profile) const {
  std::vector<ScreenPoint> path;
  path.reserve(profile.points.size());
  for (const auto& pt : profile.points) {
    path.push_back(to_screen(pt.distance, pt.z));
  }
  return path;
}

void ProfileViewTransform::set_zoom(const double zoom) {
  if (!std::isfinite(zoom)) {
    return;
  }
  zoom_ = std::clamp(zoom, config_.zoom_min, config_.zoom_max);
}

void ProfileViewTransform::zoom_in() {
  set_zoom(zoom_ * config_.zoom_step);
}

void ProfileViewTransform::zoom_out() {
  set_zoom(zoom_ / config_.zoom_step);
}

void ProfileViewTransform::reset_view() {
  zoom_ = 1.0;
  pan_offset_ = {};
}

void ProfileViewTransform::set_pan_offset(const ScreenPoint& pan_offset) {
  pan_offset_ = pan_offset;
}

void ProfileViewTransform::pan_pixels(const double dx, const double dy) {
  pan_offset_.x += dx;
  pan_offset_.y += dy;
}
}  // namespace mineviz::core

#include "mineviz_core/boreholes/borehole_trace.hpp"

#include <array>
#include <vector>

namespace mineviz::core {
namespace {
const TraceStation* first_station_at_depth(const std::vector<TraceStation>& trace,
                                           const double depth) {
  for (const auto& station : trace) {
    if (station.depth >= depth) {
      return &station;
    }
  }
  return nullptr;
}
}  // namespace

std::array<float, 3> to_render_space(const double easting, const double northing,
                                     const double elevation, const Vec3& offset) {
  return {
    static_cast<float>(easting - offset.x),
    static_cast<float>(elevation - offset.z),
    static_cast<float>(northing - offset.y),
  };
}

BoreholeGeometry build_borehole_geometry(const BoreholeCollar& collar,
                                         const std::vector<TraceStation>& trace,
                                         const std::vector<BoreholeInterval>& intervals,
                                         const BoreholeColorOptions& options,
                                         const Vec3& offset) {
  BoreholeGeometry geometry;
  geometry.collar = to_render_space(collar.easting, collar.northing, collar.elevation, offset);

  geometry.trace_points.reserve(trace.size() * 3);
  for (const auto& station : trace) {
    const auto p = to_render_space(station.easting, station.northing, station.elevation, offset);
    geometry.trace_points.insert(geometry.trace_points.end(), p.begin(), p.end());
  }

  if (options.quality_field.empty() || trace.empty()) {
    return geometry;
  }

  geometry.segments.reserve(intervals.size());
  for (int idx = 0; idx < static_cast<int>(intervals.size()); ++idx) {
    const BoreholeInterval& interval = intervals[static_cast<std::size_t>(idx)];
    const TraceStation* start = first_station_at_depth(trace, interval.from_depth);
    const TraceStation* end = first_station_at_depth(trace, interval.to_depth);
    if (start == nullptr || end == nullptr) {
      ++geometry.skipped_interval_count;
      continue;
    }

    IntervalSegment segment;
    const auto it = interval.quality_vector.find(options.quality_field);
    segment.value = it != interval.quality_vector.end() ? it->second : 0.0;
    segment.color = color_at(segment.value, options.value_min, options.value_max, options.ramp);
    segment.start = to_render_space(start->easting, start->northing, start->elevation, offset);
    segment.end = to_render_space(end->easting, end->northing, end->elevation, offset);
    segment.interval_index = idx;
    geometry.segments.push_back(segment);
  }
  return geometry;
}
}  // namespace mineviz::core

#include "mineviz_core/surface/mesh_cache.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>

namespace mineviz::core {
namespace {
constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

constexpr std::uint64_t kCheckSeed = 0x9e3779b97f4a7c15ull;
constexpr std::uint64_t kCheckMultiplier = 0xbf58476d1ce4e5b9ull;

struct KeyHasher {
  std::uint64_t fnv = kFnvOffset;
  std::uint64_t check = kCheckSeed;

  void add_word(const std::uint64_t word) {
    for (int shift = 0; shift < 64; shift += 8) {
      fnv ^= (word >> shift) & 0xffu;
      fnv *= kFnvPrime;
    }
    check ^= word + kCheckSeed + (check << 6) + (check >> 2);
    check *= kCheckMultiplier;
    check ^= check >> 31;
  }

  void add_double(const double value) {
    // -0.0 and 0.0 produce identical geometry.
    const double canonical = value == 0.0 ? 0.0 : value;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &canonical, sizeof(bits));
    add_word(bits);
  }

  void add_int(const int value) {
    add_word(static_cast<std::uint64_t>(static_cast<std::uint32_t>(value)));
  }
};
}  // namespace

SurfaceMeshKey make_surface_mesh_key(const Surface& surface, const ColorFieldSpec& color_field) {
  SurfaceMeshKey key;
  key.vertex_count = surface.vertices.size();
  key.triangle_count = surface.triangles.size();
  key.ramp = resolve_surface_ramp(surface.surface_type, color_field.ramp_override);

  KeyHasher hasher;
  for (const auto& v : surface.vertices) {
    hasher.add_double(v[0]);
    hasher.add_double(v[1]);
    hasher.add_double(v[2]);
  }
  for (const auto& tri : surface.triangles) {
    hasher.add_int(tri[0]);
    hasher.add_int(tri[1]);
    hasher.add_int(tri[2]);
  }
  hasher.add_int(static_cast<int>(key.ramp));
  if (color_field.vertex_values.size() == surface.vertices.size()) {
    for (const double value : color_field.vertex_values) {
      hasher.add_double(value);
    }
  }
  key.hash = hasher.fnv;
  key.check = hasher.check;
  return key;
}

SurfaceMeshCache::SurfaceMeshCache(const std::size_t capacity) : cache_(capacity) {}

std::shared_ptr<const RenderableMesh> SurfaceMeshCache::get_or_build(
  const Surface& surface, const ColorFieldSpec& color_field) {
  const SurfaceMeshKey key = make_surface_mesh_key(surface, color_field);
  if (const auto* cached = cache_.find(key)) {
    ++hits_;
    return *cached;
  }

  ++misses_;
  std::optional<RenderableMesh> built = build_surface_mesh(surface, color_field);
  std::shared_ptr<const RenderableMesh> mesh;
  if (built.has_value()) {
    mesh = std::make_shared<const RenderableMesh>(std::move(*built));
  }
  return cache_.insert(key, std::move(mesh));
}

void SurfaceMeshCache::clear() {
  cache_.clear();
  hits_ = 0;
  misses_ = 0;
}
}  // namespace mineviz::core

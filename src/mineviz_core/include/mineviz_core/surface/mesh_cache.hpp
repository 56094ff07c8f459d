#pragma once

#include "mineviz_core/lru_cache.hpp"
#include "mineviz_core/surface/surface_mesh.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace mineviz::core {
struct SurfaceMeshKey {
  std::uint64_t hash = 0;
  std::uint64_t check = 0;
  std::size_t vertex_count = 0;
  std::size_t triangle_count = 0;
  ColorRamp ramp = ColorRamp::kTerrain;

  bool operator==(const SurfaceMeshKey& other) const {
    return hash == other.hash && check == other.check && vertex_count == other.vertex_count &&
           triangle_count == other.triangle_count && ramp == other.ramp;
  }
};

struct SurfaceMeshKeyHash {
  std::size_t operator()(const SurfaceMeshKey& key) const {
    return static_cast<std::size_t>(key.hash);
  }
};

// Structural FNV-1a hash over vertex coordinates, triangle indices, the resolved ramp and any
// per-vertex field values, plus an independent multiply-xorshift check hash over the same words.
// Both must match for two keys to be equal.
SurfaceMeshKey make_surface_mesh_key(const Surface& surface, const ColorFieldSpec& color_field);

class SurfaceMeshCache {
 public:
  explicit SurfaceMeshCache(std::size_t capacity = 16);

  // nullptr when the surface has nothing to draw.
  std::shared_ptr<const RenderableMesh> get_or_build(const Surface& surface,
                                                     const ColorFieldSpec& color_field = {});

  void clear();
  std::size_t size() const { return cache_.size(); }
  int hits() const { return hits_; }
  int misses() const { return misses_; }

 private:
  LruCache<SurfaceMeshKey, std::shared_ptr<const RenderableMesh>, SurfaceMeshKeyHash> cache_;
  int hits_ = 0;
  int misses_ = 0;
};
}  // namespace mineviz::core

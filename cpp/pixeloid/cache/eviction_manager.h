#ifndef PIXELOID_CACHE_EVICTION_MANAGER_H
#define PIXELOID_CACHE_EVICTION_MANAGER_H

#include "pixeloid/core/types.h"

#include <cstdint>
#include <vector>

namespace pixeloid {
class CacheService;
}

namespace pixeloid::mesh {
class MeshCache;
}

namespace pixeloid::texture {
class DerivedTextureCache;
class VisibilityCache;
}

namespace pixeloid::cache {

struct SweepResult {
    std::uint32_t evictedMeshes = 0;
    std::uint32_t evictedTextures = 0;
};

/**
 * EvictionManager: pinning, adjacency retention and idle-time eviction for
 * both the mesh cache and the derived-texture cache.
 *
 * Per entry: Fresh -> Idle -> Evictable -> Evicted.
 *  - Fresh: the active scale, or a scale inside the adjacency window.
 *  - Idle: any other scale. Critical scales never leave Idle.
 *  - Evictable: idle for longer than idleThresholdMs, not critical, not adjacent.
 *  - Evicted: destroyed by sweep(), resource first, then the entry.
 *
 * Only sweep() removes entries. It is driven from the idle scheduler and
 * never from a getOrCreate call.
 */
class EvictionManager {
public:
    EvictionManager(CacheService& service,
                    mesh::MeshCache& meshes,
                    texture::DerivedTextureCache& textures,
                    texture::VisibilityCache& visibility);

    // Makes `scale` the active scale. Entries that fall inside the new
    // adjacency window are reinstated (Fresh, access time reset to now)
    // so the next sweep cannot take them.
    void setCurrentScale(Scale scale);
    bool hasCurrentScale() const { return hasCurrent_; }
    Scale currentScale() const { return current_; }

    bool isCritical(Scale scale) const;
    // True for the current scale and for scales within adjacencyRadius steps of it.
    bool isAdjacent(Scale scale) const;
    // Current, adjacent or critical: what pre-generation should keep warm.
    bool isWanted(Scale scale) const;

    // current +/- k*scaleStep for k = 1..adjacencyRadius, within [minScale, maxScale], ascending.
    std::vector<Scale> adjacentScales() const;
    // Current scale, then adjacent scales nearest first, then critical scales. No duplicates.
    std::vector<Scale> desiredScales() const;

    EntryState classify(Scale scale, double lastAccessedAt, double now) const;

    SweepResult sweep();

private:
    CacheService& service_;
    mesh::MeshCache& meshes_;
    texture::DerivedTextureCache& textures_;
    texture::VisibilityCache& visibility_;

    Scale current_ = 0.0f;
    bool hasCurrent_ = false;
};

} // namespace pixeloid::cache

#endif // PIXELOID_CACHE_EVICTION_MANAGER_H

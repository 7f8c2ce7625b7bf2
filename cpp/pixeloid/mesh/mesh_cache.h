#ifndef PIXELOID_MESH_MESH_CACHE_H
#define PIXELOID_MESH_MESH_CACHE_H

#include "pixeloid/core/types.h"
#include "pixeloid/mesh/resolution_planner.h"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace pixeloid {
class CacheService;
}

namespace pixeloid::mesh {

/**
 * Triangulated background grid for one scale. Immutable once built: a scale
 * that needs a different mesh gets a new entry, never an in-place patch.
 *
 * Vertex (x, y) of the grid is stored at (x * scale, y * scale), i.e. already
 * in screen pixels; the renderer only applies the mapper's translation.
 */
struct MeshCacheEntry {
    MeshResolution resolution;
    std::vector<float> vertexBuffer;          // x, y pairs
    std::vector<std::uint32_t> indexBuffer;   // two triangles per quad
    double createdAt;
    std::uint32_t generation;                 // build counter, unique per cache
    bool valid;
};

using MeshHandle = std::shared_ptr<const MeshCacheEntry>;

// Called before a cached mesh is dropped, so a backend can free GPU buffers.
using ReleaseMeshFn = void(*)(void* ctx, const MeshCacheEntry& mesh);

// Fills out.vertexBuffer/out.indexBuffer for `resolution`.
// Returns ResourceCreationFailed if the buffers cannot be allocated.
CacheError buildGridMesh(const MeshResolution& resolution, MeshCacheEntry& out);

class MeshCache {
public:
    struct Slot {
        MeshHandle mesh;
        double lastAccessedAt;
        EntryState state;
        bool valid;
    };

    MeshCache(CacheService& service, const ResolutionPlanner& planner);
    ~MeshCache();

    MeshCache(const MeshCache&) = delete;
    MeshCache& operator=(const MeshCache&) = delete;

    // O(1) on a valid hit. On a miss: plan, build, store. Never evicts.
    CacheError getOrCreate(Scale scale, MeshHandle& out);

    // Lookup without building or touching access time.
    MeshHandle find(Scale scale) const;
    bool isCached(Scale scale) const;

    // Next getOrCreate for `scale` rebuilds. Handles already given out stay usable.
    void invalidate(Scale scale);

    // Releases and drops one entry. Returns false when nothing was cached.
    bool remove(Scale scale);
    void clear();

    std::size_t size() const { return slots_.size(); }
    std::vector<Scale> cachedScales() const;

    void setReleaseHook(void* ctx, ReleaseMeshFn fn) {
        releaseCtx_ = ctx;
        releaseFn_ = fn;
    }

    // Eviction manager access.
    std::unordered_map<Scale, Slot>& slots() { return slots_; }
    const std::unordered_map<Scale, Slot>& slots() const { return slots_; }

private:
    void release(const Slot& slot);

    CacheService& service_;
    const ResolutionPlanner& planner_;
    std::unordered_map<Scale, Slot> slots_;
    std::uint32_t nextGeneration_ = 1;

    void* releaseCtx_ = nullptr;
    ReleaseMeshFn releaseFn_ = nullptr;
};

} // namespace pixeloid::mesh

#endif // PIXELOID_MESH_MESH_CACHE_H

#pragma once

#include "pixeloid/core/engine_config.h"
#include "pixeloid/core/types.h"
#include "pixeloid/core/util.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/cache/eviction_manager.h"
#include "pixeloid/cache/idle_scheduler.h"
#include "pixeloid/coords/coordinate_mapper.h"
#include "pixeloid/mesh/mesh_cache.h"
#include "pixeloid/mesh/resolution_planner.h"
#include "pixeloid/scene/object_table.h"
#include "pixeloid/texture/texture_cache.h"
#include "pixeloid/texture/visibility.h"
#include "pixeloid/texture/visual_version.h"

#include <cstdint>
#include <vector>

namespace pixeloid {

struct EngineStats {
    std::uint32_t cachedScaleCount;
    std::uint32_t cachedTextureCount;
    std::uint32_t visibilityEntryCount;
    std::uint32_t pendingIdleTasks;
    std::uint32_t adjacentCachedCount;
    bool criticalCached;
    bool memoryEfficient;   // cachedScaleCount <= maxCachedScalesHint
    CacheCounters counters;
};

/**
 * CanvasEngine: the multi-resolution cache core behind an infinite canvas.
 *
 * Per frame the host calls beginFrame(scale, viewport), draws activeMesh()
 * translated by the mapper offset, draws its objects, and asks for their
 * textures (getOrCreateTexture / drawObjects) after they have been drawn.
 * Spare time goes to onIdle(), which pre-generates nearby scales and runs
 * the eviction sweep.
 *
 * State changes between frames are recorded as pending flags and applied in
 * beginFrame; nothing here calls back into the host except the render and
 * release callbacks.
 */
class CanvasEngine {
public:
    CanvasEngine();
    // An invalid config falls back to defaults and sets lastError() to InvalidConfig.
    explicit CanvasEngine(const EngineConfig& config, TimeSource clock = TimeSource{});

    CanvasEngine(const CanvasEngine&) = delete;
    CanvasEngine& operator=(const CanvasEngine&) = delete;

    // Frame
    CacheError initialize(Scale scale, const ViewportSize& viewport);
    CacheError beginFrame(Scale scale, const ViewportSize& viewport);
    bool frameReady() const noexcept { return frameReady_; }
    bool hasActiveScale() const noexcept { return eviction_.hasCurrentScale(); }
    Scale currentScale() const noexcept { return eviction_.currentScale(); }
    const mesh::MeshHandle& activeMesh() const noexcept { return activeMesh_; }
    CacheError meshFor(Scale scale, mesh::MeshHandle& out);

    // Coordinates
    void setViewportOffset(const WorldPoint& offset);
    void panBy(double dx, double dy);
    const CoordinateMapper& mapper() const noexcept { return service_.mapper(); }
    WorldPoint toWorld(const VertexPoint& v) const noexcept { return service_.mapper().toWorld(v); }
    VertexPoint toVertex(const WorldPoint& w) const noexcept { return service_.mapper().toVertex(w); }
    // Screen conversions use the active scale.
    ScreenPoint worldToScreen(const WorldPoint& w) const noexcept;
    WorldPoint screenToWorld(const ScreenPoint& s) const noexcept;
    WorldBounds viewportWorldBounds() const noexcept;

    // Objects
    bool upsertObject(ObjectId id, const WorldBounds& bounds, const texture::VisualAttributes& visual);
    bool removeObject(ObjectId id);
    const ObjectRecord* findObject(ObjectId id) const { return objects_.find(id); }
    std::size_t objectCount() const { return objects_.size(); }
    // Objects intersecting the current viewport, ascending id.
    void queryVisible(std::vector<ObjectId>& out) const;

    // Textures
    CacheError getOrCreateTexture(ObjectId id, Scale scale, const texture::RenderCallback& render,
                                  texture::TextureLookup& out);
    CacheError textureFor(ObjectId id, Scale scale, texture::TextureLookup& out);
    CacheError revalidate(const texture::TextureLookup& lookup) const;
    // Textures for every visible object at the active scale. Objects that fail
    // are skipped and counted in skippedObjects; the batch never aborts.
    // Returns the number of skipped objects.
    std::uint32_t drawObjects(const texture::RenderCallback& render, std::vector<texture::TextureLookup>& out);

    // Maintenance
    std::uint32_t onIdle(double budgetMs);
    void requestSweep();
    void clear();

    void setMeshReleaseHook(void* ctx, mesh::ReleaseMeshFn fn) { meshes_.setReleaseHook(ctx, fn); }
    void setTextureReleaseHook(void* ctx, texture::ReleaseTextureFn fn) { textures_.setReleaseHook(ctx, fn); }
    void setClock(TimeSource clock) { service_.setClock(clock); }

    EngineStats getStats() const;
    CacheError lastError() const noexcept { return lastError_; }
    void clearError() const { lastError_ = CacheError::Ok; }

    // Subsystems, for effect layers and tests.
    const CacheService& service() const noexcept { return service_; }
    const mesh::MeshCache& meshes() const noexcept { return meshes_; }
    const texture::DerivedTextureCache& textures() const noexcept { return textures_; }
    const texture::VisibilityCache& visibility() const noexcept { return visibility_; }
    const cache::EvictionManager& eviction() const noexcept { return eviction_; }
    const cache::IdleScheduler& scheduler() const noexcept { return scheduler_; }

private:
    void setError(CacheError err) const { lastError_ = err; }
    void applyPendingScale(Scale scale);

    // Declaration order is construction order.
    CacheService service_;
    mesh::ResolutionPlanner planner_;
    mesh::MeshCache meshes_;
    ObjectTable objects_;
    texture::VisibilityCache visibility_;
    texture::DerivedTextureCache textures_;
    cache::EvictionManager eviction_;
    cache::IdleScheduler scheduler_;

    mesh::MeshHandle activeMesh_;
    bool frameReady_ = false;
    bool pendingRewarm_ = false;   // set by clear(); next beginFrame re-queues warm-up

    mutable CacheError lastError_{CacheError::Ok};
};

} // namespace pixeloid

#ifndef PIXELOID_CACHE_CACHE_SERVICE_H
#define PIXELOID_CACHE_CACHE_SERVICE_H

#include "pixeloid/core/engine_config.h"
#include "pixeloid/core/types.h"
#include "pixeloid/core/util.h"
#include "pixeloid/coords/coordinate_mapper.h"

#include <cstdint>

namespace pixeloid {

// Counters shared by every cache. Plain integers: all access is on the frame loop.
struct CacheCounters {
    std::uint32_t meshGenerations = 0;
    std::uint32_t meshCacheHits = 0;
    std::uint32_t meshCacheMisses = 0;
    std::uint32_t evictedMeshes = 0;
    std::uint32_t textureCaptures = 0;
    std::uint32_t textureCacheHits = 0;
    std::uint32_t evictedTextures = 0;
    std::uint32_t releasedTextures = 0;
    std::uint32_t largeTextureAllocations = 0;
    std::uint32_t skippedObjects = 0;
    std::uint32_t completedPregenerations = 0;
    std::uint32_t droppedPregenerations = 0;
    std::uint32_t sweepCount = 0;
};

/**
 * CacheService: the state every cache component shares.
 *
 * Owns the configuration, the clock, the coordinate mapper and the counters.
 * It is created once by the engine and handed by reference to the planner,
 * the mesh cache, the texture cache and the eviction manager. Nothing in this
 * library keeps it in a global.
 */
class CacheService {
public:
    explicit CacheService(const EngineConfig& config, TimeSource clock = TimeSource{})
        : config_(config), clock_(clock) {}

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    const EngineConfig& config() const noexcept { return config_; }
    const MeshConfig& meshConfig() const noexcept { return config_.mesh; }
    const EvictionPolicy& evictionPolicy() const noexcept { return config_.eviction; }
    const TextureConfig& textureConfig() const noexcept { return config_.texture; }

    double now() const { return clock_.now(); }
    void setClock(TimeSource clock) noexcept { clock_ = clock; }

    CoordinateMapper& mapper() noexcept { return mapper_; }
    const CoordinateMapper& mapper() const noexcept { return mapper_; }

    // Viewport in screen pixels. Together with the mapper offset it defines
    // what is on screen; viewportRevision() changes whenever either does.
    void setViewportSize(const ViewportSize& size) noexcept {
        if (size.width == viewportSize_.width && size.height == viewportSize_.height) return;
        viewportSize_ = size;
        ++viewportSizeRevision_;
    }
    const ViewportSize& viewportSize() const noexcept { return viewportSize_; }
    std::uint32_t viewportRevision() const noexcept { return viewportSizeRevision_ + mapper_.revision(); }
    WorldBounds viewportWorldBounds(Scale scale) const noexcept {
        return mapper_.viewportWorldBounds(viewportSize_, scale);
    }

    CacheCounters& counters() noexcept { return counters_; }
    const CacheCounters& counters() const noexcept { return counters_; }
    void resetCounters() noexcept { counters_ = CacheCounters{}; }

private:
    EngineConfig config_;
    TimeSource clock_;
    CoordinateMapper mapper_;
    ViewportSize viewportSize_{0.0f, 0.0f};
    std::uint32_t viewportSizeRevision_ = 0;
    CacheCounters counters_;
};

} // namespace pixeloid

#endif // PIXELOID_CACHE_CACHE_SERVICE_H

// Construction, reset and statistics. Frame and object methods live in impl/.
#include "pixeloid/engine.h"
#include "pixeloid/core/logging.h"

#include <algorithm>

namespace {

pixeloid::EngineConfig effectiveConfig(const pixeloid::EngineConfig& config) {
    return pixeloid::validateConfig(config) == pixeloid::CacheError::Ok ? config : pixeloid::EngineConfig{};
}

} // namespace

namespace pixeloid {

CanvasEngine::CanvasEngine()
    : CanvasEngine(EngineConfig{})
{
}

CanvasEngine::CanvasEngine(const EngineConfig& config, TimeSource clock)
    : service_(effectiveConfig(config), clock)
    , planner_(service_)
    , meshes_(service_, planner_)
    , objects_()
    , visibility_()
    , textures_(service_, objects_, visibility_)
    , eviction_(service_, meshes_, textures_, visibility_)
    , scheduler_(service_, meshes_, eviction_)
{
    if (validateConfig(config) != CacheError::Ok) {
        PIXELOID_LOG_WARN("engine: invalid configuration, using defaults");
        setError(CacheError::InvalidConfig);
    }
}

void CanvasEngine::clear() {
    scheduler_.cancelAll();
    activeMesh_.reset();
    textures_.clear();
    meshes_.clear();
    visibility_.clear();
    frameReady_ = false;
    pendingRewarm_ = true;
}

EngineStats CanvasEngine::getStats() const {
    EngineStats stats{};
    const std::vector<Scale> cached = meshes_.cachedScales();
    stats.cachedScaleCount = static_cast<std::uint32_t>(cached.size());
    stats.cachedTextureCount = static_cast<std::uint32_t>(textures_.size());
    stats.visibilityEntryCount = static_cast<std::uint32_t>(visibility_.size());
    stats.pendingIdleTasks = static_cast<std::uint32_t>(scheduler_.pendingCount());

    stats.criticalCached = true;
    for (Scale critical : service_.evictionPolicy().criticalScales) {
        if (!meshes_.isCached(critical)) {
            stats.criticalCached = false;
            break;
        }
    }

    std::uint32_t adjacentCached = 0;
    for (Scale scale : eviction_.adjacentScales()) {
        if (meshes_.isCached(scale)) ++adjacentCached;
    }
    stats.adjacentCachedCount = adjacentCached;
    stats.memoryEfficient = stats.cachedScaleCount <= service_.evictionPolicy().maxCachedScalesHint;
    stats.counters = service_.counters();
    return stats;
}

} // namespace pixeloid

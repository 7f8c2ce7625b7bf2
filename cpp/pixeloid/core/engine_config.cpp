#include "pixeloid/core/engine_config.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"

#include <cmath>

namespace pixeloid {

CacheError validateConfig(const EngineConfig& config) {
    const MeshConfig& mesh = config.mesh;
    if (!std::isfinite(mesh.baseViewportSize) || mesh.baseViewportSize <= 0.0f) {
        PIXELOID_LOG_WARN("config: baseViewportSize must be positive (got %f)", mesh.baseViewportSize);
        return CacheError::InvalidConfig;
    }
    if (!std::isfinite(mesh.oversizePercent) || mesh.oversizePercent < 0.0f) {
        PIXELOID_LOG_WARN("config: oversizePercent must be >= 0 (got %f)", mesh.oversizePercent);
        return CacheError::InvalidConfig;
    }
    if (mesh.maxVertexCount == 0) return CacheError::InvalidConfig;

    const EvictionPolicy& ev = config.eviction;
    if (!(ev.idleThresholdMs > 0.0) || !(ev.sweepIntervalMs > 0.0)) {
        PIXELOID_LOG_WARN("config: eviction intervals must be positive");
        return CacheError::InvalidConfig;
    }
    if (!isValidScale(ev.scaleStep) || !isValidScale(ev.minScale) || !isValidScale(ev.maxScale)) {
        return CacheError::InvalidConfig;
    }
    if (ev.minScale > ev.maxScale) return CacheError::InvalidConfig;
    for (const Scale s : ev.criticalScales) {
        if (!isValidScale(s)) {
            PIXELOID_LOG_WARN("config: critical scale %f is not a valid scale", s);
            return CacheError::InvalidConfig;
        }
    }

    if (config.texture.largeTexturePixelThreshold == 0) return CacheError::InvalidConfig;
    if (config.idle.maxTasksPerSlice == 0) return CacheError::InvalidConfig;
    return CacheError::Ok;
}

} // namespace pixeloid

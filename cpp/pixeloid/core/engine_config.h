#ifndef PIXELOID_CORE_ENGINE_CONFIG_H
#define PIXELOID_CORE_ENGINE_CONFIG_H

#include "pixeloid/core/types.h"

#include <cstdint>
#include <vector>

namespace pixeloid {

struct MeshConfig {
    float baseViewportSize = 1000.0f;     // world units covered at scale 1 before padding
    float oversizePercent = 20.0f;        // padding beyond the viewport, amortizes pans
    std::uint64_t maxVertexCount = 4000000;
};

struct EvictionPolicy {
    std::vector<Scale> criticalScales{1.0f, 2.0f}; // never evicted
    std::uint32_t adjacencyRadius = 2;             // steps kept around the current scale
    double idleThresholdMs = 60000.0;
    double sweepIntervalMs = 30000.0;
    Scale scaleStep = 1.0f;
    Scale minScale = 1.0f;
    Scale maxScale = 100.0f;
    std::uint32_t maxCachedScalesHint = 15;
};

struct TextureConfig {
    // Not a cap. Allocations above it are only counted and logged.
    std::uint64_t largeTexturePixelThreshold = 4096ull * 4096ull;
};

struct IdleConfig {
    std::uint32_t maxTasksPerSlice = 8;
};

struct EngineConfig {
    MeshConfig mesh{};
    EvictionPolicy eviction{};
    TextureConfig texture{};
    IdleConfig idle{};
};

// Returns CacheError::InvalidConfig for values no cache can work with.
CacheError validateConfig(const EngineConfig& config);

} // namespace pixeloid

#endif // PIXELOID_CORE_ENGINE_CONFIG_H

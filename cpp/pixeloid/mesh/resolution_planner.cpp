#include "pixeloid/mesh/resolution_planner.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"

#include <algorithm>
#include <cmath>

namespace pixeloid::mesh {

namespace {

// A grid needs two vertices per axis to hold a single quad.
constexpr std::uint32_t kMinGridVertices = 2;

} // namespace

double ResolutionPlanner::footprintWorldSize() const {
    const MeshConfig& cfg = service_.meshConfig();
    // base * (100 + pct) / 100 rather than base * (1 + pct/100): exact for integral inputs.
    return static_cast<double>(cfg.baseViewportSize) * (100.0 + static_cast<double>(cfg.oversizePercent)) / 100.0;
}

CacheError ResolutionPlanner::plan(Scale scale, MeshResolution& out) const {
    if (!isValidScale(scale)) {
        PIXELOID_LOG_WARN("plan: rejected scale %f", scale);
        return CacheError::InvalidScale;
    }

    const MeshConfig& cfg = service_.meshConfig();
    const double cells = std::ceil(footprintWorldSize() / static_cast<double>(scale));
    const double side = std::max(cells, static_cast<double>(kMinGridVertices));
    if (side * side > static_cast<double>(cfg.maxVertexCount)) {
        PIXELOID_LOG_WARN("plan: scale %f needs %.0f x %.0f vertices (limit %llu)",
                          scale, side, side, static_cast<unsigned long long>(cfg.maxVertexCount));
        return CacheError::ResourceCreationFailed;
    }

    out.scale = scale;
    out.oversizePercent = cfg.oversizePercent;
    out.vertexGridWidth = static_cast<std::uint32_t>(side);
    out.vertexGridHeight = static_cast<std::uint32_t>(side);
    return CacheError::Ok;
}

} // namespace pixeloid::mesh

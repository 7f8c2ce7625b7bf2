#ifndef PIXELOID_MESH_RESOLUTION_PLANNER_H
#define PIXELOID_MESH_RESOLUTION_PLANNER_H

#include "pixeloid/core/types.h"

#include <cstdint>

namespace pixeloid {
class CacheService;
}

namespace pixeloid::mesh {

// Derived description of the background mesh for one scale.
struct MeshResolution {
    Scale scale;
    float oversizePercent;
    std::uint32_t vertexGridWidth;
    std::uint32_t vertexGridHeight;

    std::uint64_t vertexCount() const {
        return static_cast<std::uint64_t>(vertexGridWidth) * vertexGridHeight;
    }
    std::uint64_t indexCount() const {
        if (vertexGridWidth < 2 || vertexGridHeight < 2) return 0;
        return meshIndicesPerQuad * static_cast<std::uint64_t>(vertexGridWidth - 1) * (vertexGridHeight - 1);
    }
};

inline bool operator==(const MeshResolution& a, const MeshResolution& b) {
    return a.scale == b.scale && a.oversizePercent == b.oversizePercent &&
           a.vertexGridWidth == b.vertexGridWidth && a.vertexGridHeight == b.vertexGridHeight;
}

/**
 * ResolutionPlanner: scale -> MeshResolution.
 *
 * The footprint is baseViewportSize padded by oversizePercent, so a mesh
 * survives small pans without regeneration. Grid size is
 * ceil(footprint / scale) per axis: fewer, larger cells at higher zoom keep the
 * vertex count bounded. Pure and deterministic.
 */
class ResolutionPlanner {
public:
    explicit ResolutionPlanner(const CacheService& service) : service_(service) {}

    // InvalidScale for non-positive or non-finite scales, ResourceCreationFailed
    // when the grid would exceed MeshConfig::maxVertexCount.
    CacheError plan(Scale scale, MeshResolution& out) const;

    double footprintWorldSize() const;

private:
    const CacheService& service_;
};

} // namespace pixeloid::mesh

#endif // PIXELOID_MESH_RESOLUTION_PLANNER_H

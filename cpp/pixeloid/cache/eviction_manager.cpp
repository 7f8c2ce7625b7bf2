#include "pixeloid/cache/eviction_manager.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/mesh/mesh_cache.h"
#include "pixeloid/texture/texture_cache.h"
#include "pixeloid/texture/visibility.h"

#include <algorithm>
#include <cmath>

namespace pixeloid::cache {

namespace {

// Scales that differ by less than a small fraction of one step are the same
// grid position.
constexpr float kScaleTolerance = 1e-4f;

bool sameScale(Scale a, Scale b, Scale step) {
    return std::fabs(a - b) <= kScaleTolerance * step;
}

} // namespace

EvictionManager::EvictionManager(CacheService& service,
                                 mesh::MeshCache& meshes,
                                 texture::DerivedTextureCache& textures,
                                 texture::VisibilityCache& visibility)
    : service_(service)
    , meshes_(meshes)
    , textures_(textures)
    , visibility_(visibility)
{
}

void EvictionManager::setCurrentScale(Scale scale) {
    current_ = scale;
    hasCurrent_ = true;

    const double now = service_.now();
    for (auto& kv : meshes_.slots()) {
        auto& slot = kv.second;
        if (isAdjacent(kv.first)) {
            slot.state = EntryState::Fresh;
            slot.lastAccessedAt = now;
        } else {
            slot.state = EntryState::Idle;
        }
    }
    for (auto& kv : textures_.entries()) {
        auto& entry = kv.second;
        if (isAdjacent(kv.first.scale)) {
            entry.state = EntryState::Fresh;
            entry.lastAccessedAt = now;
        } else {
            entry.state = EntryState::Idle;
        }
    }
}

bool EvictionManager::isCritical(Scale scale) const {
    const EvictionPolicy& policy = service_.evictionPolicy();
    for (Scale critical : policy.criticalScales) {
        if (sameScale(critical, scale, policy.scaleStep)) return true;
    }
    return false;
}

bool EvictionManager::isAdjacent(Scale scale) const {
    if (!hasCurrent_) return false;
    const EvictionPolicy& policy = service_.evictionPolicy();
    const float window = static_cast<float>(policy.adjacencyRadius) * policy.scaleStep;
    return std::fabs(scale - current_) <= window + kScaleTolerance * policy.scaleStep;
}

bool EvictionManager::isWanted(Scale scale) const {
    return isAdjacent(scale) || isCritical(scale);
}

std::vector<Scale> EvictionManager::adjacentScales() const {
    std::vector<Scale> scales;
    if (!hasCurrent_) return scales;
    const EvictionPolicy& policy = service_.evictionPolicy();
    const double step = static_cast<double>(policy.scaleStep);
    const double base = static_cast<double>(policy.minScale);
    const double upper = static_cast<double>(policy.maxScale) + kScaleTolerance * step;

    // On the step grid, neighbours are minScale + n*step computed in double,
    // so they are bit-equal to the float scale the host asks for later.
    const double gridIndex = (static_cast<double>(current_) - base) / step;
    const double nearest = std::round(gridIndex);
    const bool onGrid = std::fabs(gridIndex - nearest) <= kScaleTolerance;

    auto neighbour = [&](double k) {
        return onGrid ? base + (nearest + k) * step : static_cast<double>(current_) + k * step;
    };

    for (std::uint32_t k = 1; k <= policy.adjacencyRadius; ++k) {
        const double below = neighbour(-static_cast<double>(k));
        const double above = neighbour(static_cast<double>(k));
        if (below >= base - kScaleTolerance * step && isValidScale(static_cast<Scale>(below))) {
            scales.push_back(static_cast<Scale>(below));
        }
        if (above <= upper) scales.push_back(static_cast<Scale>(above));
    }
    std::sort(scales.begin(), scales.end());
    return scales;
}

std::vector<Scale> EvictionManager::desiredScales() const {
    std::vector<Scale> scales;
    if (!hasCurrent_) return scales;
    const EvictionPolicy& policy = service_.evictionPolicy();

    auto add = [&](Scale s) {
        for (Scale existing : scales) {
            if (sameScale(existing, s, policy.scaleStep)) return;
        }
        scales.push_back(s);
    };

    add(current_);
    std::vector<Scale> adjacent = adjacentScales();
    std::stable_sort(adjacent.begin(), adjacent.end(), [&](Scale a, Scale b) {
        return std::fabs(a - current_) < std::fabs(b - current_);
    });
    for (Scale s : adjacent) add(s);
    for (Scale s : policy.criticalScales) {
        if (isValidScale(s)) add(s);
    }
    return scales;
}

EntryState EvictionManager::classify(Scale scale, double lastAccessedAt, double now) const {
    if (isAdjacent(scale)) {
        return EntryState::Fresh;
    }
    if (isCritical(scale)) {
        return EntryState::Idle;
    }
    if (now - lastAccessedAt > service_.evictionPolicy().idleThresholdMs) {
        return EntryState::Evictable;
    }
    return EntryState::Idle;
}

SweepResult EvictionManager::sweep() {
    SweepResult result;
    const double now = service_.now();

    std::vector<Scale> meshVictims;
    for (auto& kv : meshes_.slots()) {
        const EntryState state = classify(kv.first, kv.second.lastAccessedAt, now);
        kv.second.state = state;
        if (state == EntryState::Evictable) {
            meshVictims.push_back(kv.first);
        }
    }
    for (Scale scale : meshVictims) {
        if (meshes_.remove(scale)) {
            visibility_.removeScale(scale);
            ++result.evictedMeshes;
        }
    }

    std::vector<ObjectVisualKey> textureVictims;
    for (auto& kv : textures_.entries()) {
        const EntryState state = classify(kv.first.scale, kv.second.lastAccessedAt, now);
        kv.second.state = state;
        if (state == EntryState::Evictable) {
            textureVictims.push_back(kv.first);
        }
    }
    for (const ObjectVisualKey& key : textureVictims) {
        if (textures_.evict(key)) {
            ++result.evictedTextures;
        }
    }

    CacheCounters& counters = service_.counters();
    counters.evictedMeshes += result.evictedMeshes;
    counters.evictedTextures += result.evictedTextures;
    counters.sweepCount++;

    if (result.evictedMeshes > 0 || result.evictedTextures > 0) {
        PIXELOID_LOG_DEBUG("eviction: sweep removed %u meshes and %u textures",
                           result.evictedMeshes, result.evictedTextures);
    }
    return result;
}

} // namespace pixeloid::cache

#include "pixeloid/mesh/mesh_cache.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"

#include <algorithm>
#include <new>

namespace pixeloid::mesh {

CacheError buildGridMesh(const MeshResolution& resolution, MeshCacheEntry& out) {
    const std::uint32_t w = resolution.vertexGridWidth;
    const std::uint32_t h = resolution.vertexGridHeight;
    const float level = resolution.scale;

    try {
        out.vertexBuffer.assign(static_cast<std::size_t>(resolution.vertexCount()) * meshFloatsPerVertex, 0.0f);
        out.indexBuffer.assign(static_cast<std::size_t>(resolution.indexCount()), 0u);
    } catch (const std::bad_alloc&) {
        out.vertexBuffer.clear();
        out.indexBuffer.clear();
        return CacheError::ResourceCreationFailed;
    }

    std::size_t v = 0;
    for (std::uint32_t y = 0; y < h; ++y) {
        for (std::uint32_t x = 0; x < w; ++x) {
            out.vertexBuffer[v++] = static_cast<float>(x) * level;
            out.vertexBuffer[v++] = static_cast<float>(y) * level;
        }
    }

    std::size_t i = 0;
    for (std::uint32_t y = 0; y + 1 < h; ++y) {
        for (std::uint32_t x = 0; x + 1 < w; ++x) {
            const std::uint32_t topLeft = y * w + x;
            const std::uint32_t topRight = topLeft + 1;
            const std::uint32_t bottomLeft = (y + 1) * w + x;
            const std::uint32_t bottomRight = bottomLeft + 1;

            out.indexBuffer[i++] = topLeft;
            out.indexBuffer[i++] = topRight;
            out.indexBuffer[i++] = bottomLeft;

            out.indexBuffer[i++] = topRight;
            out.indexBuffer[i++] = bottomRight;
            out.indexBuffer[i++] = bottomLeft;
        }
    }

    out.resolution = resolution;
    out.valid = true;
    return CacheError::Ok;
}

MeshCache::MeshCache(CacheService& service, const ResolutionPlanner& planner)
    : service_(service)
    , planner_(planner)
{
}

MeshCache::~MeshCache() {
    clear();
}

CacheError MeshCache::getOrCreate(Scale scale, MeshHandle& out) {
    if (!isValidScale(scale)) {
        return CacheError::InvalidScale;
    }

    const double now = service_.now();
    auto it = slots_.find(scale);
    if (it != slots_.end() && it->second.valid && it->second.mesh) {
        it->second.lastAccessedAt = now;
        it->second.state = EntryState::Fresh;
        service_.counters().meshCacheHits++;
        out = it->second.mesh;
        return CacheError::Ok;
    }
    service_.counters().meshCacheMisses++;

    MeshResolution resolution{};
    const CacheError planErr = planner_.plan(scale, resolution);
    if (planErr != CacheError::Ok) {
        return planErr;
    }

    std::shared_ptr<MeshCacheEntry> entry;
    CacheError buildErr = CacheError::Ok;
    try {
        entry = std::make_shared<MeshCacheEntry>();
    } catch (const std::bad_alloc&) {
        buildErr = CacheError::ResourceCreationFailed;
    }
    if (entry) {
        buildErr = buildGridMesh(resolution, *entry);
    }
    if (buildErr != CacheError::Ok) {
        PIXELOID_LOG_WARN("mesh: allocation failed for scale %f (%ux%u)",
                          scale, resolution.vertexGridWidth, resolution.vertexGridHeight);
        return buildErr;
    }
    entry->createdAt = now;
    entry->generation = nextGeneration_++;

    PIXELOID_LOG_DEBUG("mesh: generated scale %f with %zu vertices and %zu indices",
                       scale, entry->vertexBuffer.size() / meshFloatsPerVertex, entry->indexBuffer.size());

    if (it != slots_.end()) {
        // Stale slot: release the old build before replacing it.
        release(it->second);
        it->second = Slot{std::move(entry), now, EntryState::Fresh, true};
        out = it->second.mesh;
    } else {
        auto inserted = slots_.emplace(scale, Slot{std::move(entry), now, EntryState::Fresh, true});
        out = inserted.first->second.mesh;
    }
    service_.counters().meshGenerations++;
    return CacheError::Ok;
}

MeshHandle MeshCache::find(Scale scale) const {
    auto it = slots_.find(scale);
    if (it == slots_.end() || !it->second.valid) return nullptr;
    return it->second.mesh;
}

bool MeshCache::isCached(Scale scale) const {
    auto it = slots_.find(scale);
    return it != slots_.end() && it->second.valid && it->second.mesh != nullptr;
}

void MeshCache::invalidate(Scale scale) {
    auto it = slots_.find(scale);
    if (it != slots_.end()) {
        it->second.valid = false;
    }
}

bool MeshCache::remove(Scale scale) {
    auto it = slots_.find(scale);
    if (it == slots_.end()) return false;
    release(it->second);
    slots_.erase(it);
    return true;
}

void MeshCache::clear() {
    for (const auto& kv : slots_) {
        release(kv.second);
    }
    slots_.clear();
}

std::vector<Scale> MeshCache::cachedScales() const {
    std::vector<Scale> scales;
    scales.reserve(slots_.size());
    for (const auto& kv : slots_) {
        if (kv.second.valid) scales.push_back(kv.first);
    }
    std::sort(scales.begin(), scales.end());
    return scales;
}

void MeshCache::release(const Slot& slot) {
    if (releaseFn_ && slot.mesh) {
        releaseFn_(releaseCtx_, *slot.mesh);
    }
}

} // namespace pixeloid::mesh

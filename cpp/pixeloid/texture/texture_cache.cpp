#include "pixeloid/texture/texture_cache.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/core/util.h"
#include "pixeloid/scene/object_table.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pixeloid::texture {

void texturePixelSize(const WorldBounds& bounds, Scale scale, std::uint32_t& width, std::uint32_t& height) {
    const double w = std::ceil(bounds.width() * static_cast<double>(scale));
    const double h = std::ceil(bounds.height() * static_cast<double>(scale));
    constexpr double kMax = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
    width = (std::isfinite(w) && w > 0.0) ? static_cast<std::uint32_t>(std::min(w, kMax)) : 0u;
    height = (std::isfinite(h) && h > 0.0) ? static_cast<std::uint32_t>(std::min(h, kMax)) : 0u;
}

TextureFrame frameForVisibleBounds(const WorldBounds& full, const WorldBounds& visible, Scale scale,
                                   const TextureHandle& texture) {
    const double s = static_cast<double>(scale);
    const float texW = static_cast<float>(texture.width);
    const float texH = static_cast<float>(texture.height);

    const float x = std::clamp(static_cast<float>((visible.minX - full.minX) * s), 0.0f, texW);
    const float y = std::clamp(static_cast<float>((visible.minY - full.minY) * s), 0.0f, texH);
    const float w = std::clamp(static_cast<float>(visible.width() * s), 0.0f, texW - x);
    const float h = std::clamp(static_cast<float>(visible.height() * s), 0.0f, texH - y);
    return TextureFrame{x, y, w, h};
}

DerivedTextureCache::DerivedTextureCache(CacheService& service, const ObjectTable& objects, VisibilityCache& visibility)
    : service_(service)
    , objects_(objects)
    , visibility_(visibility)
{
}

DerivedTextureCache::~DerivedTextureCache() {
    clear();
}

CacheError DerivedTextureCache::getOrCreate(ObjectId objectId, Scale scale, const RenderCallback& render, TextureLookup& out) {
    if (inRender_) {
        // A capture callback asked for another object's texture.
        PIXELOID_LOG_WARN("texture: reentrant request for object %u at scale %f", objectId, scale);
        return CacheError::ReentrantRender;
    }
    if (!isValidScale(scale)) {
        return CacheError::InvalidScale;
    }
    const ObjectRecord* object = objects_.find(objectId);
    if (!object) {
        return CacheError::UnknownObject;
    }

    const ObjectVisualKey key{objectId, scale};
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.visualVersion == object->visualVersion) {
        service_.counters().textureCacheHits++;
        it->second.lastAccessedAt = service_.now();
        it->second.state = EntryState::Fresh;
        fillLookup(*object, it->second, out);
        out.captured = false;
        return CacheError::Ok;
    }

    const std::uint64_t capturedVersion = object->visualVersion;
    TextureHandle texture{0, 0, 0};
    const CacheError err = capture(*object, scale, render, texture);
    if (err != CacheError::Ok) {
        noteFailure(objectId, err);
        return err;
    }

    // The callback is host code and may have cleared, swept or edited the
    // caches. Nothing looked up before the capture is used after it.
    object = objects_.find(objectId);
    if (!object) {
        release(texture);
        return CacheError::UnknownObject;
    }
    failing_.erase(objectId);

    it = entries_.find(key);
    if (it != entries_.end()) {
        release(it->second.texture);
        it->second.texture = texture;
        it->second.visualVersion = capturedVersion;
        it->second.generation = nextGeneration_++;
    } else {
        it = entries_.emplace(key, TextureCacheEntry{
            key, texture, capturedVersion, 0.0, EntryState::Fresh, nextGeneration_++}).first;
    }

    it->second.lastAccessedAt = service_.now();
    it->second.state = EntryState::Fresh;
    fillLookup(*object, it->second, out);
    out.captured = true;
    return CacheError::Ok;
}

CacheError DerivedTextureCache::textureFor(ObjectId objectId, Scale scale, TextureLookup& out) {
    if (!isValidScale(scale)) {
        return CacheError::InvalidScale;
    }
    const ObjectRecord* object = objects_.find(objectId);
    if (!object) {
        return CacheError::UnknownObject;
    }
    auto it = entries_.find(ObjectVisualKey{objectId, scale});
    if (it == entries_.end() || it->second.visualVersion != object->visualVersion) {
        // An out-of-date texture is not served; the next draw re-captures it.
        return CacheError::CacheMiss;
    }
    it->second.lastAccessedAt = service_.now();
    fillLookup(*object, it->second, out);
    out.captured = false;
    return CacheError::Ok;
}

CacheError DerivedTextureCache::revalidate(const TextureLookup& lookup) const {
    auto it = entries_.find(lookup.key);
    if (it == entries_.end() ||
        it->second.generation != lookup.entryGeneration ||
        it->second.texture.id != lookup.texture.id) {
        return CacheError::StaleEvictionRace;
    }
    return CacheError::Ok;
}

bool DerivedTextureCache::isCached(ObjectId objectId, Scale scale) const {
    return entries_.find(ObjectVisualKey{objectId, scale}) != entries_.end();
}

bool DerivedTextureCache::remove(ObjectId objectId, Scale scale) {
    return evict(ObjectVisualKey{objectId, scale});
}

std::size_t DerivedTextureCache::removeObject(ObjectId objectId) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.objectId == objectId) {
            release(it->second.texture);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    failing_.erase(objectId);
    visibility_.removeObject(objectId);
    return removed;
}

void DerivedTextureCache::clear() {
    for (const auto& kv : entries_) {
        release(kv.second.texture);
    }
    entries_.clear();
    failing_.clear();
}

bool DerivedTextureCache::evict(const ObjectVisualKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    // Resource first, then the entry.
    release(it->second.texture);
    entries_.erase(it);
    visibility_.remove(key);
    return true;
}

CacheError DerivedTextureCache::capture(const ObjectRecord& object, Scale scale, const RenderCallback& render, TextureHandle& outTexture) {
    RasterRequest request{};
    request.objectId = object.id;
    request.scale = scale;
    request.worldBounds = object.bounds;
    texturePixelSize(object.bounds, scale, request.pixelWidth, request.pixelHeight);
    if (request.pixelWidth == 0 || request.pixelHeight == 0) {
        PIXELOID_LOG_DEBUG("texture: object %u has degenerate bounds at scale %f", object.id, scale);
        return CacheError::DegenerateBounds;
    }
    if (!render.render) {
        return CacheError::ResourceCreationFailed;
    }

    const CoordinateMapper& mapper = service_.mapper();
    request.vertexOrigin = mapper.toVertex(WorldPoint{object.bounds.minX, object.bounds.minY});
    request.screenOrigin = CoordinateMapper::vertexToScreen(request.vertexOrigin, scale);

    const std::uint64_t pixels = static_cast<std::uint64_t>(request.pixelWidth) * request.pixelHeight;
    if (pixels > service_.textureConfig().largeTexturePixelThreshold) {
        service_.counters().largeTextureAllocations++;
        PIXELOID_LOG_WARN("texture: large allocation %ux%u for object %u at scale %f",
                          request.pixelWidth, request.pixelHeight, object.id, scale);
    }

    inRender_ = true;
    const bool ok = render.render(render.ctx, request, outTexture);
    inRender_ = false;

    if (!ok || outTexture.id == 0) {
        if (ok) {
            release(outTexture);
        }
        outTexture = TextureHandle{0, 0, 0};
        return CacheError::ResourceCreationFailed;
    }
    service_.counters().textureCaptures++;
    return CacheError::Ok;
}

void DerivedTextureCache::fillLookup(const ObjectRecord& object, const TextureCacheEntry& entry, TextureLookup& out) {
    const Scale scale = entry.key.scale;
    const ObjectVisibilityState& vis = visibility_.get(
        object, scale, service_.viewportWorldBounds(scale), service_.viewportRevision());

    out.key = entry.key;
    out.texture = entry.texture;
    out.visibility = vis.visibility;
    out.visualVersion = entry.visualVersion;
    out.entryGeneration = entry.generation;

    if (vis.visibility == Visibility::PartiallyOnScreen) {
        out.frame = frameForVisibleBounds(object.bounds, vis.onScreenBounds, scale, entry.texture);
        out.drawBounds = vis.onScreenBounds;
    } else {
        out.frame = TextureFrame{0.0f, 0.0f,
                                 static_cast<float>(entry.texture.width),
                                 static_cast<float>(entry.texture.height)};
        out.drawBounds = object.bounds;
    }
}

void DerivedTextureCache::release(const TextureHandle& texture) {
    if (texture.id == 0) return;
    service_.counters().releasedTextures++;
    if (releaseFn_) {
        releaseFn_(releaseCtx_, texture);
    }
}

void DerivedTextureCache::noteFailure(ObjectId objectId, CacheError err) {
    if (err != CacheError::ResourceCreationFailed) return;
    // One log line per failure streak, not one per frame.
    if (failing_.insert(objectId).second) {
        PIXELOID_LOG_WARN("texture: capture failed for object %u (%s), retrying next frame",
                          objectId, cacheErrorName(err));
    }
}

} // namespace pixeloid::texture

#ifndef PIXELOID_TEXTURE_TEXTURE_CACHE_H
#define PIXELOID_TEXTURE_TEXTURE_CACHE_H

#include "pixeloid/core/types.h"
#include "pixeloid/texture/visibility.h"

#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pixeloid {
class CacheService;
class ObjectTable;
}

namespace pixeloid::texture {

// What the rasterizer is asked to capture. Always the full object bounds,
// never just the visible slice.
struct RasterRequest {
    ObjectId objectId;
    Scale scale;
    WorldBounds worldBounds;
    VertexPoint vertexOrigin;   // bounds top-left in vertex space
    ScreenPoint screenOrigin;   // same point in screen pixels (capture origin)
    std::uint32_t pixelWidth;
    std::uint32_t pixelHeight;
};

// Captures an object that has already been drawn this frame.
// Returns false (or a texture with id 0) when the backend could not allocate.
using RenderObjectFn = bool(*)(void* ctx, const RasterRequest& request, TextureHandle& outTexture);

// Destroys a backend texture. Called exactly once per captured texture.
using ReleaseTextureFn = void(*)(void* ctx, const TextureHandle& texture);

struct RenderCallback {
    void* ctx;
    RenderObjectFn render;
};

struct TextureLookup {
    ObjectVisualKey key;
    TextureHandle texture;
    TextureFrame frame;          // whole texture unless partially on screen
    Visibility visibility;
    WorldBounds drawBounds;      // world rectangle the frame covers
    std::uint64_t visualVersion;
    std::uint32_t entryGeneration;
    bool captured;               // true when this call rendered a new texture
};

struct TextureCacheEntry {
    ObjectVisualKey key;
    TextureHandle texture;
    std::uint64_t visualVersion;
    double lastAccessedAt;
    EntryState state;
    std::uint32_t generation;
};

/**
 * DerivedTextureCache: rendered snapshots of objects, keyed by (objectId, scale).
 *
 * A texture is reused while the object's visual version is unchanged, so a
 * pan or a move never re-captures; a fill or stroke edit does. For partially
 * visible objects the full texture is kept and a frame into it is returned,
 * so the object does not come back distorted when it is fully visible again.
 *
 * getOrCreate never evicts. Eviction is the sweep's job (EvictionManager).
 */
class DerivedTextureCache {
public:
    DerivedTextureCache(CacheService& service, const ObjectTable& objects, VisibilityCache& visibility);
    ~DerivedTextureCache();

    DerivedTextureCache(const DerivedTextureCache&) = delete;
    DerivedTextureCache& operator=(const DerivedTextureCache&) = delete;

    void setReleaseHook(void* ctx, ReleaseTextureFn fn) {
        releaseCtx_ = ctx;
        releaseFn_ = fn;
    }

    // Failure modes: InvalidScale, UnknownObject, DegenerateBounds,
    // ResourceCreationFailed, ReentrantRender. All of them mean
    // "skip this object this frame".
    CacheError getOrCreate(ObjectId objectId, Scale scale, const RenderCallback& render, TextureLookup& out);

    // Read-only access for effect layers. Never renders; CacheMiss when absent
    // or captured for an older visual version.
    CacheError textureFor(ObjectId objectId, Scale scale, TextureLookup& out);

    // StaleEvictionRace when the entry behind `lookup` was evicted or replaced.
    CacheError revalidate(const TextureLookup& lookup) const;

    bool isCached(ObjectId objectId, Scale scale) const;
    bool remove(ObjectId objectId, Scale scale);
    std::size_t removeObject(ObjectId objectId);
    void clear();

    std::size_t size() const { return entries_.size(); }
    bool isRendering() const { return inRender_; }

    // Eviction manager access.
    std::unordered_map<ObjectVisualKey, TextureCacheEntry, ObjectVisualKeyHash>& entries() { return entries_; }
    const std::unordered_map<ObjectVisualKey, TextureCacheEntry, ObjectVisualKeyHash>& entries() const { return entries_; }
    bool evict(const ObjectVisualKey& key);

private:
    CacheError capture(const ObjectRecord& object, Scale scale, const RenderCallback& render, TextureHandle& outTexture);
    void fillLookup(const ObjectRecord& object, const TextureCacheEntry& entry, TextureLookup& out);
    void release(const TextureHandle& texture);
    void noteFailure(ObjectId objectId, CacheError err);

    CacheService& service_;
    const ObjectTable& objects_;
    VisibilityCache& visibility_;

    std::unordered_map<ObjectVisualKey, TextureCacheEntry, ObjectVisualKeyHash> entries_;
    std::unordered_set<ObjectId> failing_;  // objects inside a failure streak
    std::uint32_t nextGeneration_ = 1;
    bool inRender_ = false;

    void* releaseCtx_ = nullptr;
    ReleaseTextureFn releaseFn_ = nullptr;
};

// Pixel size of an object's texture at `scale`: ceil(worldSize * scale).
// Zero on either axis means degenerate bounds.
void texturePixelSize(const WorldBounds& bounds, Scale scale, std::uint32_t& width, std::uint32_t& height);

// Frame of `visible` inside a texture rendered for `full`, clamped to the texture.
TextureFrame frameForVisibleBounds(const WorldBounds& full, const WorldBounds& visible, Scale scale,
                                   const TextureHandle& texture);

} // namespace pixeloid::texture

#endif // PIXELOID_TEXTURE_TEXTURE_CACHE_H

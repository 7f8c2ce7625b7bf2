#ifndef PIXELOID_CORE_TYPES_H
#define PIXELOID_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <functional>

// Lightweight types shared by the coordinate, mesh and texture caches.

namespace pixeloid {

// Zoom level: screen pixels per world unit. Primary key of both caches.
using Scale = float;
using ObjectId = std::uint32_t;

static constexpr ObjectId kInvalidObjectId = 0;

// Mesh vertex buffers are tightly packed (x, y) float pairs.
static constexpr std::size_t meshFloatsPerVertex = 2;
static constexpr std::size_t meshIndicesPerQuad = 6;

// Vertex space is the GPU-side coordinate system of the background mesh.
struct VertexPoint {
    float x;
    float y;
};

// World ("pixeloid") space, zoom independent.
struct WorldPoint {
    double x;
    double y;
};

struct ScreenPoint {
    float x;
    float y;
};

struct WorldBounds {
    double minX, minY, maxX, maxY;

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
};

inline bool operator==(const WorldBounds& a, const WorldBounds& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

inline bool operator!=(const WorldBounds& a, const WorldBounds& b) {
    return !(a == b);
}

struct ViewportSize {
    float width;  // screen pixels
    float height; // screen pixels
};

enum class CacheError : std::uint32_t {
    Ok = 0,
    InvalidScale = 1,
    DegenerateBounds = 2,
    ResourceCreationFailed = 3,
    StaleEvictionRace = 4,
    UnknownObject = 5,
    ReentrantRender = 6,
    CacheMiss = 7,
    InvalidConfig = 8,
};

inline const char* cacheErrorName(CacheError err) {
    switch (err) {
        case CacheError::Ok: return "Ok";
        case CacheError::InvalidScale: return "InvalidScale";
        case CacheError::DegenerateBounds: return "DegenerateBounds";
        case CacheError::ResourceCreationFailed: return "ResourceCreationFailed";
        case CacheError::StaleEvictionRace: return "StaleEvictionRace";
        case CacheError::UnknownObject: return "UnknownObject";
        case CacheError::ReentrantRender: return "ReentrantRender";
        case CacheError::CacheMiss: return "CacheMiss";
        case CacheError::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

// Lifecycle of a cached mesh or texture as seen by the eviction sweep.
enum class EntryState : std::uint8_t {
    Fresh = 0,      // active scale, or reinstated by the adjacency window
    Idle = 1,       // no longer the active scale
    Evictable = 2,  // idle past the threshold, not pinned, not adjacent
    Evicted = 3,
};

enum class Visibility : std::uint8_t {
    OnScreen = 0,
    PartiallyOnScreen = 1,
    OffScreen = 2,
};

// Composite texture/visibility key: a texture's pixel size depends on scale.
struct ObjectVisualKey {
    ObjectId objectId;
    Scale scale;
};

inline bool operator==(const ObjectVisualKey& a, const ObjectVisualKey& b) {
    return a.objectId == b.objectId && a.scale == b.scale;
}

struct ObjectVisualKeyHash {
    std::size_t operator()(const ObjectVisualKey& key) const noexcept {
        std::uint32_t scaleBits = 0;
        std::memcpy(&scaleBits, &key.scale, sizeof(scaleBits));
        const std::uint64_t packed = (static_cast<std::uint64_t>(key.objectId) << 32) | scaleBits;
        return std::hash<std::uint64_t>{}(packed);
    }
};

// Opaque backend texture. id 0 means "no texture".
struct TextureHandle {
    std::uint32_t id;
    std::uint32_t width;
    std::uint32_t height;
};

// Sub-rectangle of a texture, in texture pixels.
struct TextureFrame {
    float x;
    float y;
    float width;
    float height;
};

} // namespace pixeloid

#endif // PIXELOID_CORE_TYPES_H

#ifndef PIXELOID_TEXTURE_VISIBILITY_H
#define PIXELOID_TEXTURE_VISIBILITY_H

#include "pixeloid/core/types.h"

#include <cstdint>
#include <unordered_map>

namespace pixeloid {
struct ObjectRecord;
}

namespace pixeloid::texture {

struct ObjectVisibilityState {
    Visibility visibility;
    // Visible part of the object in world units. Equals the object bounds when
    // fully on screen; empty (all zero) when off screen.
    WorldBounds onScreenBounds;
};

// Classifies object bounds against the viewport rectangle (both world units).
// Touching edges count as off screen.
ObjectVisibilityState classifyVisibility(const WorldBounds& object, const WorldBounds& viewport);

/**
 * Per-(objectId, scale) memo of classifyVisibility. An entry is reused while
 * both the viewport revision and the object's bounds revision are unchanged,
 * which avoids redoing the intersection math for every object every frame.
 */
class VisibilityCache {
public:
    const ObjectVisibilityState& get(const ObjectRecord& object,
                                     Scale scale,
                                     const WorldBounds& viewport,
                                     std::uint32_t viewportRevision);

    void remove(const ObjectVisualKey& key) { entries_.erase(key); }
    void removeObject(ObjectId id);
    void removeScale(Scale scale);
    void clear() { entries_.clear(); }
    std::size_t size() const { return entries_.size(); }

    std::uint32_t recomputeCount() const { return recomputeCount_; }

private:
    struct Entry {
        ObjectVisibilityState state;
        std::uint32_t viewportRevision;
        std::uint32_t boundsRevision;
    };

    std::unordered_map<ObjectVisualKey, Entry, ObjectVisualKeyHash> entries_;
    std::uint32_t recomputeCount_ = 0;
};

} // namespace pixeloid::texture

#endif // PIXELOID_TEXTURE_VISIBILITY_H

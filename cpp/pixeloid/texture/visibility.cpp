#include "pixeloid/texture/visibility.h"

#include "pixeloid/scene/object_table.h"

#include <algorithm>

namespace pixeloid::texture {

ObjectVisibilityState classifyVisibility(const WorldBounds& object, const WorldBounds& viewport) {
    if (!intersects(object, viewport)) {
        return ObjectVisibilityState{Visibility::OffScreen, WorldBounds{0.0, 0.0, 0.0, 0.0}};
    }

    const bool inside =
        object.minX >= viewport.minX && object.maxX <= viewport.maxX &&
        object.minY >= viewport.minY && object.maxY <= viewport.maxY;
    if (inside) {
        return ObjectVisibilityState{Visibility::OnScreen, object};
    }

    const WorldBounds clipped{
        std::max(object.minX, viewport.minX),
        std::max(object.minY, viewport.minY),
        std::min(object.maxX, viewport.maxX),
        std::min(object.maxY, viewport.maxY),
    };
    return ObjectVisibilityState{Visibility::PartiallyOnScreen, clipped};
}

const ObjectVisibilityState& VisibilityCache::get(const ObjectRecord& object,
                                                  Scale scale,
                                                  const WorldBounds& viewport,
                                                  std::uint32_t viewportRevision) {
    const ObjectVisualKey key{object.id, scale};
    auto it = entries_.find(key);
    if (it != entries_.end() &&
        it->second.viewportRevision == viewportRevision &&
        it->second.boundsRevision == object.boundsRevision) {
        return it->second.state;
    }

    recomputeCount_++;
    const Entry entry{classifyVisibility(object.bounds, viewport), viewportRevision, object.boundsRevision};
    if (it != entries_.end()) {
        it->second = entry;
        return it->second.state;
    }
    return entries_.emplace(key, entry).first->second.state;
}

void VisibilityCache::removeObject(ObjectId id) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.objectId == id) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void VisibilityCache::removeScale(Scale scale) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.scale == scale) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace pixeloid::texture

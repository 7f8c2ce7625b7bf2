// CanvasEngine object table and derived textures.

#include "pixeloid/engine.h"
#include "pixeloid/core/logging.h"

namespace pixeloid {

bool CanvasEngine::upsertObject(ObjectId id, const WorldBounds& bounds, const texture::VisualAttributes& visual) {
    if (id == kInvalidObjectId) {
        setError(CacheError::UnknownObject);
        return false;
    }
    // A visual change is picked up lazily: the next texture request sees a
    // different visual version and re-captures.
    return objects_.upsert(id, bounds, visual);
}

bool CanvasEngine::removeObject(ObjectId id) {
    if (!objects_.remove(id)) {
        return false;
    }
    textures_.removeObject(id);
    return true;
}

void CanvasEngine::queryVisible(std::vector<ObjectId>& out) const {
    out.clear();
    if (!eviction_.hasCurrentScale()) return;
    objects_.queryIntersecting(viewportWorldBounds(), out);
}

CacheError CanvasEngine::getOrCreateTexture(ObjectId id, Scale scale, const texture::RenderCallback& render,
                                            texture::TextureLookup& out) {
    const CacheError err = textures_.getOrCreate(id, scale, render, out);
    if (err != CacheError::Ok) {
        setError(err);
    }
    return err;
}

CacheError CanvasEngine::textureFor(ObjectId id, Scale scale, texture::TextureLookup& out) {
    const CacheError err = textures_.textureFor(id, scale, out);
    if (err != CacheError::Ok && err != CacheError::CacheMiss) {
        setError(err);
    }
    return err;
}

CacheError CanvasEngine::revalidate(const texture::TextureLookup& lookup) const {
    return textures_.revalidate(lookup);
}

std::uint32_t CanvasEngine::drawObjects(const texture::RenderCallback& render, std::vector<texture::TextureLookup>& out) {
    out.clear();
    if (!frameReady_) {
        return 0;
    }

    std::vector<ObjectId> visible;
    queryVisible(visible);
    out.reserve(visible.size());

    const Scale scale = eviction_.currentScale();
    std::uint32_t skipped = 0;
    for (ObjectId id : visible) {
        texture::TextureLookup lookup{};
        const CacheError err = textures_.getOrCreate(id, scale, render, lookup);
        if (err != CacheError::Ok) {
            ++skipped;
            continue;
        }
        out.push_back(lookup);
    }

    if (skipped > 0) {
        service_.counters().skippedObjects += skipped;
        PIXELOID_LOG_DEBUG("engine: skipped %u of %zu visible objects", skipped, visible.size());
    }
    return skipped;
}

} // namespace pixeloid

// CanvasEngine frame loop: scale activation, active mesh, viewport and idle work.

#include "pixeloid/engine.h"
#include "pixeloid/core/logging.h"

namespace pixeloid {

CacheError CanvasEngine::initialize(Scale scale, const ViewportSize& viewport) {
    if (!isValidScale(scale)) {
        setError(CacheError::InvalidScale);
        return CacheError::InvalidScale;
    }
    scheduler_.resetSweepTimer();
    pendingRewarm_ = true;
    return beginFrame(scale, viewport);
}

CacheError CanvasEngine::beginFrame(Scale scale, const ViewportSize& viewport) {
    if (!isValidScale(scale)) {
        // Rejected at the boundary: the previous frame state is left untouched.
        setError(CacheError::InvalidScale);
        return CacheError::InvalidScale;
    }

    service_.setViewportSize(viewport);
    const bool scaleChanged =
        pendingRewarm_ || !eviction_.hasCurrentScale() || eviction_.currentScale() != scale;

    // Active mesh first, so warm-up only queues the scales around it.
    mesh::MeshHandle mesh;
    const CacheError err = meshes_.getOrCreate(scale, mesh);
    if (scaleChanged) {
        applyPendingScale(scale);
    }
    if (err != CacheError::Ok) {
        // Nothing to draw the background with: the one fatal frame error.
        PIXELOID_LOG_WARN("engine: no mesh for active scale %f (%s)", scale, cacheErrorName(err));
        activeMesh_.reset();
        frameReady_ = false;
        setError(err);
        return err;
    }

    activeMesh_ = std::move(mesh);
    frameReady_ = true;
    return CacheError::Ok;
}

void CanvasEngine::applyPendingScale(Scale scale) {
    eviction_.setCurrentScale(scale);
    scheduler_.scheduleDesired();
    pendingRewarm_ = false;
}

CacheError CanvasEngine::meshFor(Scale scale, mesh::MeshHandle& out) {
    const CacheError err = meshes_.getOrCreate(scale, out);
    if (err != CacheError::Ok) {
        setError(err);
    }
    return err;
}

void CanvasEngine::setViewportOffset(const WorldPoint& offset) {
    service_.mapper().setOffset(offset);
}

void CanvasEngine::panBy(double dx, double dy) {
    service_.mapper().panBy(dx, dy);
}

ScreenPoint CanvasEngine::worldToScreen(const WorldPoint& w) const noexcept {
    const Scale scale = eviction_.hasCurrentScale() ? eviction_.currentScale() : 1.0f;
    return service_.mapper().worldToScreen(w, scale);
}

WorldPoint CanvasEngine::screenToWorld(const ScreenPoint& s) const noexcept {
    const Scale scale = eviction_.hasCurrentScale() ? eviction_.currentScale() : 1.0f;
    return service_.mapper().screenToWorld(s, scale);
}

WorldBounds CanvasEngine::viewportWorldBounds() const noexcept {
    const Scale scale = eviction_.hasCurrentScale() ? eviction_.currentScale() : 1.0f;
    return service_.viewportWorldBounds(scale);
}

std::uint32_t CanvasEngine::onIdle(double budgetMs) {
    return scheduler_.runIdle(budgetMs);
}

void CanvasEngine::requestSweep() {
    scheduler_.requestSweep();
}

} // namespace pixeloid

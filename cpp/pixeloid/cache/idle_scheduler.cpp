#include "pixeloid/cache/idle_scheduler.h"

#include "pixeloid/cache/cache_service.h"
#include "pixeloid/cache/eviction_manager.h"
#include "pixeloid/core/logging.h"
#include "pixeloid/mesh/mesh_cache.h"

#include <algorithm>

namespace pixeloid::cache {

IdleScheduler::IdleScheduler(CacheService& service, mesh::MeshCache& meshes, EvictionManager& eviction)
    : service_(service)
    , meshes_(meshes)
    , eviction_(eviction)
{
    lastSweepAt_ = service_.now();
}

void IdleScheduler::scheduleDesired() {
    for (Scale scale : eviction_.desiredScales()) {
        if (!meshes_.isCached(scale)) {
            schedulePregeneration(scale);
        }
    }
}

bool IdleScheduler::schedulePregeneration(Scale scale) {
    if (!isValidScale(scale) || isQueued(scale)) {
        return false;
    }
    queue_.push_back(IdleTask{IdleTaskKind::PregenerateMesh, scale});
    return true;
}

std::uint32_t IdleScheduler::runIdle(double budgetMs) {
    if (budgetMs <= 0.0) return 0;

    const double start = service_.now();
    const std::uint32_t maxTasks = service_.config().idle.maxTasksPerSlice;
    std::uint32_t executed = 0;

    while (!queue_.empty() && executed < maxTasks) {
        const IdleTask task = queue_.front();
        queue_.pop_front();
        if (runTask(task)) {
            ++executed;
        }
        if (service_.now() - start >= budgetMs) {
            break;
        }
    }

    if (sweepPending() && executed < maxTasks && service_.now() - start < budgetMs) {
        runTask(IdleTask{IdleTaskKind::Sweep, 0.0f});
        ++executed;
    }
    return executed;
}

void IdleScheduler::cancelAll() {
    queue_.clear();
    sweepRequested_ = false;
}

void IdleScheduler::resetSweepTimer() {
    lastSweepAt_ = service_.now();
}

bool IdleScheduler::sweepPending() const {
    if (sweepRequested_) return true;
    return service_.now() - lastSweepAt_ >= service_.evictionPolicy().sweepIntervalMs;
}

bool IdleScheduler::runTask(const IdleTask& task) {
    switch (task.kind) {
        case IdleTaskKind::PregenerateMesh: {
            // The active scale may have moved on since this was queued.
            if (!eviction_.isWanted(task.scale)) {
                service_.counters().droppedPregenerations++;
                PIXELOID_LOG_DEBUG("idle: dropped stale pre-generation for scale %f", task.scale);
                return false;
            }
            if (meshes_.isCached(task.scale)) {
                return false;
            }
            mesh::MeshHandle mesh;
            const CacheError err = meshes_.getOrCreate(task.scale, mesh);
            if (err != CacheError::Ok) {
                PIXELOID_LOG_WARN("idle: pre-generation for scale %f failed (%s)",
                                  task.scale, cacheErrorName(err));
                return true;
            }
            service_.counters().completedPregenerations++;
            return true;
        }
        case IdleTaskKind::Sweep:
            eviction_.sweep();
            sweepRequested_ = false;
            lastSweepAt_ = service_.now();
            return true;
    }
    return false;
}

bool IdleScheduler::isQueued(Scale scale) const {
    return std::any_of(queue_.begin(), queue_.end(), [scale](const IdleTask& task) {
        return task.kind == IdleTaskKind::PregenerateMesh && task.scale == scale;
    });
}

} // namespace pixeloid::cache

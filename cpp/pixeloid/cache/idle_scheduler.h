#ifndef PIXELOID_CACHE_IDLE_SCHEDULER_H
#define PIXELOID_CACHE_IDLE_SCHEDULER_H

#include "pixeloid/core/types.h"

#include <cstdint>
#include <deque>
#include <vector>

namespace pixeloid {
class CacheService;
}

namespace pixeloid::mesh {
class MeshCache;
}

namespace pixeloid::cache {

class EvictionManager;

enum class IdleTaskKind : std::uint8_t {
    PregenerateMesh = 0,
    Sweep = 1,
};

struct IdleTask {
    IdleTaskKind kind;
    Scale scale;
};

/**
 * IdleScheduler: deferred work that runs only when the frame loop has spare time.
 *
 * Pre-generation tasks are cheap to queue and cheap to discard: whether a
 * scale is still wanted is checked when the task runs, not when it is queued.
 * The eviction sweep runs from here as well, every sweepIntervalMs or when
 * requested, after the queued pre-generation work of the slice.
 */
class IdleScheduler {
public:
    IdleScheduler(CacheService& service, mesh::MeshCache& meshes, EvictionManager& eviction);

    // Queues pre-generation for every wanted scale that has no valid mesh yet.
    void scheduleDesired();
    // Returns false when the scale is already queued.
    bool schedulePregeneration(Scale scale);
    void requestSweep() { sweepRequested_ = true; }

    // Runs up to IdleConfig::maxTasksPerSlice tasks, stopping early once
    // budgetMs has elapsed. Returns the number of tasks executed.
    std::uint32_t runIdle(double budgetMs);

    void cancelAll();
    // Restarts the sweep interval from now.
    void resetSweepTimer();

    std::size_t pendingCount() const { return queue_.size(); }
    bool sweepPending() const;
    double lastSweepAt() const { return lastSweepAt_; }

private:
    bool runTask(const IdleTask& task);
    bool isQueued(Scale scale) const;

    CacheService& service_;
    mesh::MeshCache& meshes_;
    EvictionManager& eviction_;

    std::deque<IdleTask> queue_;
    bool sweepRequested_ = false;
    double lastSweepAt_ = 0.0;
};

} // namespace pixeloid::cache

#endif // PIXELOID_CACHE_IDLE_SCHEDULER_H

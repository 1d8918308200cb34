#ifndef TRON_SCHEDULER_H
#define TRON_SCHEDULER_H

#include "burst_queue.h"
#include "compositor.h"
#include "control_state.h"

namespace tron {

/**
 * Scheduler - The single driver of animation time
 *
 * tick(now):
 *   1. advance every burst whose deadline has passed (one transition each)
 *   2. drop finished bursts
 *   3. render exactly one frame
 *   4. report whether any burst is still live
 *
 * Repeating a tick with the same timestamp advances nothing. Read-only
 * with respect to ControlState.
 */
class Scheduler {
public:
    Scheduler(BurstQueue& queue, Compositor& compositor, const ControlState& state)
        : queue_(queue)
        , compositor_(compositor)
        , state_(state)
        , tickCount_(0)
        , lastStepCount_(0) {}

    bool tick(uint32_t now);

    uint32_t getTickCount() const { return tickCount_; }

    // Transitions applied during the most recent tick
    uint8_t getLastStepCount() const { return lastStepCount_; }

private:
    BurstQueue& queue_;
    Compositor& compositor_;
    const ControlState& state_;

    uint32_t tickCount_;
    uint8_t lastStepCount_;
};

} // namespace tron

#endif // TRON_SCHEDULER_H

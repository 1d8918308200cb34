#include "scheduler.h"

namespace tron {

bool Scheduler::tick(uint32_t now) {
    uint8_t steps = 0;

    for (uint8_t i = 0; i < queue_.size(); i++) {
        Burst& burst = queue_[i];
        if (burst.isDue(now)) {
            burst.step();
            steps++;
        }
    }

    queue_.removeFinished();

    // One frame per tick, however many bursts moved
    compositor_.render(state_.ambient, queue_);

    lastStepCount_ = steps;
    tickCount_++;
    return !queue_.empty();
}

} // namespace tron

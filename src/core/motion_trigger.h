#ifndef TRON_MOTION_TRIGGER_H
#define TRON_MOTION_TRIGGER_H

#include "admission.h"
#include "burst_queue.h"
#include "control_state.h"

namespace tron {

/**
 * MotionTrigger - Turns PIR levels into motion admissions
 *
 * Only a rising edge triggers. While bursts from the previous motion
 * sequence are still live, further edges are ignored.
 */
class MotionTrigger {
public:
    MotionTrigger(const ControlState& state, const BurstQueue& queue, BurstAdmission& admission)
        : state_(state)
        , queue_(queue)
        , admission_(admission)
        , level_(false)
        , triggerCount_(0)
        , ignoredCount_(0) {}

    // Feed the current sensor level; returns bursts admitted
    uint8_t onLevel(bool high, uint32_t now);

    // Feed a latched edge (from the IRQ) regardless of the sampled level
    uint8_t onRisingEdge(uint32_t now);

    bool getLevel() const { return level_; }
    uint32_t getTriggerCount() const { return triggerCount_; }
    uint32_t getIgnoredCount() const { return ignoredCount_; }

private:
    const ControlState& state_;
    const BurstQueue& queue_;
    BurstAdmission& admission_;

    bool level_;
    uint32_t triggerCount_;
    uint32_t ignoredCount_;
};

} // namespace tron

#endif // TRON_MOTION_TRIGGER_H

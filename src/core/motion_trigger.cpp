#include "motion_trigger.h"
#include "../logging.h"

namespace tron {

uint8_t MotionTrigger::onLevel(bool high, uint32_t now) {
    bool rising = high && !level_;
    if (high != level_) {
        LOG_DEBUG(LogTag::MOTION, "PIR: %s", high ? "HIGH" : "LOW");
    }
    level_ = high;
    return rising ? onRisingEdge(now) : 0;
}

uint8_t MotionTrigger::onRisingEdge(uint32_t now) {
    if (!state_.anim.motionEnabled) {
        ignoredCount_++;
        return 0;
    }

    // Previous sequence still running
    if (queue_.countFrom(BurstSource::Motion) > 0) {
        ignoredCount_++;
        LOG_DEBUG(LogTag::MOTION, "Motion sequence in progress, edge ignored");
        return 0;
    }

    triggerCount_++;
    return admission_.admit(BurstSource::Motion, now);
}

} // namespace tron

#ifndef TRON_ADMISSION_H
#define TRON_ADMISSION_H

#include "burst_queue.h"
#include "control_state.h"

namespace tron {

/**
 * BurstAdmission - The only place bursts are created
 *
 * Manual fire: one burst, no delay.
 * Motion: random pre-delay in [delay_min, delay_max], then a random
 * number of bursts in [burst_count_min, burst_count_max], each starting
 * once the previous one's one-way travel plus burst_gap has elapsed.
 *
 * Every burst snapshots the animation parameters at admission, drawing
 * any "variable" endpoint, trail or speed from its min/max range. A full
 * queue drops the request.
 */
class BurstAdmission {
public:
    BurstAdmission(const ControlState& state, BurstQueue& queue)
        : state_(state)
        , queue_(queue)
        , stripLength_(DEFAULT_LED_COUNT)
        , dropped_(0) {}

    void setStripLength(uint16_t length) { stripLength_ = length; }

    // Returns the number of bursts admitted
    uint8_t admit(BurstSource source, uint32_t now);

    // Requests (or parts of a motion sequence) refused because the queue was full
    uint32_t getDroppedCount() const { return dropped_; }

    // Inclusive uniform draw using the FastLED PRNG
    static uint32_t randomBetween(uint32_t lo, uint32_t hi);

private:
    // PARAM_VARIABLE -> draw from [lo, hi], anything else as stored
    static int32_t resolve(int32_t value, uint32_t lo, uint32_t hi);

    BurstSpec makeSpec(BurstSource source, uint32_t delayMs) const;

    const ControlState& state_;
    BurstQueue& queue_;
    uint16_t stripLength_;
    uint32_t dropped_;
};

} // namespace tron

#endif // TRON_ADMISSION_H

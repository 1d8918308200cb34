#ifndef TRON_BURST_H
#define TRON_BURST_H

#include <FastLED.h>
#include "control_state.h"

namespace tron {

enum class BurstState : uint8_t {
    Pending = 0,    // Counting down its start delay
    Active,         // Stepping toward its endpoint
    Finished        // Terminal, removed at end of tick
};

enum class BurstSource : uint8_t {
    Motion = 0,
    Manual
};

/**
 * BurstSpec - Everything a burst needs, resolved at admission
 *
 * Values may be out of range; Burst::start clamps them against the strip.
 */
struct BurstSpec {
    int32_t startPosition = 0;
    int32_t endpoint = 0;       // Already resolved (never PARAM_VARIABLE)
    int32_t trailLength = 1;
    int32_t speedMs = 1;
    uint32_t delayMs = 0;
    BounceMode bounce = BounceMode::OneWay;
    BurstSource source = BurstSource::Manual;
    CRGB color = CRGB::Black;
};

// Wraparound-safe "deadline has passed": any non-positive delta is due
inline bool deadlineReached(uint32_t now, uint32_t deadline) {
    return static_cast<int32_t>(now - deadline) >= 0;
}

/**
 * Burst - One running chase animation
 *
 * pending -> active -> finished. Each due tick applies exactly one
 * transition. After start() the burst never reads shared state again.
 *
 * Deadlines are chained from the previous deadline, not from the tick
 * that served it, so a late tick does not stretch the travel time; a
 * burst that fell behind catches up one step per tick.
 */
class Burst {
public:
    Burst();

    // Initialize from a spec; clamps endpoint/trail/speed to the strip
    void start(const BurstSpec& spec, uint16_t stripLength, uint32_t now);

    bool isDue(uint32_t now) const {
        return state_ != BurstState::Finished && deadlineReached(now, nextStepAt_);
    }

    // Apply one state-machine transition (caller checks isDue)
    void step();

    // Add the trail into a frame with saturating addition
    void render(CRGB* frame, uint16_t count) const;

    BurstState getState() const { return state_; }
    bool isPending() const { return state_ == BurstState::Pending; }
    bool isActive() const { return state_ == BurstState::Active; }
    bool isFinished() const { return state_ == BurstState::Finished; }

    uint16_t getPosition() const { return position_; }
    int8_t getDirection() const { return direction_; }
    uint16_t getEndpoint() const { return endpoint_; }
    uint16_t getTrailLength() const { return trailLength_; }
    uint16_t getSpeed() const { return speedMs_; }
    BounceMode getBounce() const { return bounce_; }
    BurstSource getSource() const { return source_; }
    CRGB getColor() const { return color_; }
    uint32_t getNextStepAt() const { return nextStepAt_; }
    // Start delay still to run; 0 once due or active
    uint32_t getRemainingDelay(uint32_t now) const;
    uint32_t getStepCount() const { return stepCount_; }

private:
    void activate();
    void advance();

    uint16_t position_;
    int8_t direction_;          // +1 forward, -1 backward
    uint16_t endpoint_;
    uint16_t trailLength_;
    uint16_t speedMs_;
    uint32_t nextStepAt_;
    uint32_t stepCount_;
    BurstState state_;
    BounceMode bounce_;
    BurstSource source_;
    CRGB color_;
};

} // namespace tron

#endif // TRON_BURST_H

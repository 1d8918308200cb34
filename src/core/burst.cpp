/**
 * Burst state machine
 */

#include "burst.h"
#include "../constants.h"

namespace tron {

namespace {

int32_t clampInt(int32_t v, int32_t lo, int32_t hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

} // namespace

Burst::Burst()
    : position_(0)
    , direction_(1)
    , endpoint_(0)
    , trailLength_(1)
    , speedMs_(1)
    , nextStepAt_(0)
    , stepCount_(0)
    , state_(BurstState::Finished)
    , bounce_(BounceMode::OneWay)
    , source_(BurstSource::Manual)
    , color_(CRGB::Black) {}

void Burst::start(const BurstSpec& spec, uint16_t stripLength, uint32_t now) {
    int32_t length = stripLength > 0 ? stripLength : 1;
    int32_t lastIndex = length - 1;

    position_ = static_cast<uint16_t>(clampInt(spec.startPosition, 0, lastIndex));
    endpoint_ = static_cast<uint16_t>(clampInt(spec.endpoint, 0, lastIndex));
    trailLength_ = static_cast<uint16_t>(clampInt(spec.trailLength, 1, length));
    speedMs_ = static_cast<uint16_t>(clampInt(spec.speedMs, 1, MAX_SPEED_MS));
    direction_ = endpoint_ >= position_ ? 1 : -1;

    bounce_ = spec.bounce;
    source_ = spec.source;
    color_ = spec.color;

    nextStepAt_ = now + spec.delayMs;
    stepCount_ = 0;
    state_ = BurstState::Pending;
}

uint32_t Burst::getRemainingDelay(uint32_t now) const {
    if (state_ != BurstState::Pending || deadlineReached(now, nextStepAt_)) {
        return 0;
    }
    return nextStepAt_ - now;
}

void Burst::step() {
    switch (state_) {
        case BurstState::Pending:
            activate();
            break;
        case BurstState::Active:
            advance();
            break;
        case BurstState::Finished:
            break;
    }
}

void Burst::activate() {
    state_ = BurstState::Active;

    // Zero-length one-way travel
    if (bounce_ == BounceMode::OneWay && position_ == endpoint_) {
        state_ = BurstState::Finished;
        return;
    }

    nextStepAt_ += speedMs_;
}

void Burst::advance() {
    if (bounce_ == BounceMode::ForwardBack) {
        // Nothing to travel between origin and endpoint
        if (endpoint_ == 0) {
            nextStepAt_ += speedMs_;
            return;
        }

        position_ = static_cast<uint16_t>(position_ + direction_);
        stepCount_++;

        if (direction_ > 0 && position_ >= endpoint_) {
            direction_ = -1;
        } else if (direction_ < 0 && position_ == 0) {
            direction_ = 1;
        }
    } else {
        position_ = static_cast<uint16_t>(position_ + direction_);
        stepCount_++;

        if (position_ == endpoint_) {
            state_ = BurstState::Finished;
            return;
        }
    }

    nextStepAt_ += speedMs_;
}

void Burst::render(CRGB* frame, uint16_t count) const {
    if (state_ != BurstState::Active || !frame) return;

    // Head at position, fading out behind the direction of travel
    for (uint16_t i = 0; i < trailLength_; i++) {
        int32_t idx = static_cast<int32_t>(position_) - static_cast<int32_t>(i) * direction_;
        if (idx < 0 || idx >= count) continue;

        uint8_t level = static_cast<uint8_t>((255u * (trailLength_ - i)) / trailLength_);
        CRGB color = color_;
        color.nscale8(level);
        frame[idx] += color;
    }
}

} // namespace tron

#include "admission.h"
#include "cct.h"
#include "../logging.h"
#include <FastLED.h>

namespace tron {

uint32_t BurstAdmission::randomBetween(uint32_t lo, uint32_t hi) {
    if (hi < lo) {
        uint32_t t = lo;
        lo = hi;
        hi = t;
    }
    // Ranges are bounded by the parameter table (<= MAX_DELAY_MS)
    if (hi >= 0xFFFF) hi = 0xFFFE;
    if (lo > hi) lo = hi;
    return random16(static_cast<uint16_t>(lo), static_cast<uint16_t>(hi + 1));
}

int32_t BurstAdmission::resolve(int32_t value, uint32_t lo, uint32_t hi) {
    return value == PARAM_VARIABLE ? static_cast<int32_t>(randomBetween(lo, hi)) : value;
}

BurstSpec BurstAdmission::makeSpec(BurstSource source, uint32_t delayMs) const {
    const AnimationParams& anim = state_.anim;

    BurstSpec spec;
    spec.startPosition = 0;
    spec.endpoint = resolve(anim.endpoint, anim.endpointMin, anim.endpointMax);
    spec.trailLength = resolve(anim.trailLength, anim.trailMin, anim.trailMax);
    spec.speedMs = resolve(anim.speedMs, anim.speedMinMs, anim.speedMaxMs);
    spec.delayMs = delayMs;
    spec.bounce = anim.bounce;
    spec.source = source;
    spec.color = burstHeadColor(anim);
    return spec;
}

uint8_t BurstAdmission::admit(BurstSource source, uint32_t now) {
    if (source == BurstSource::Manual) {
        if (!queue_.admit(makeSpec(source, 0), stripLength_, now)) {
            dropped_++;
            LOG_DEBUG(LogTag::LED, "Burst queue full, manual fire dropped");
            return 0;
        }
        return 1;
    }

    const AnimationParams& anim = state_.anim;
    uint32_t offset = randomBetween(anim.delayMinMs, anim.delayMaxMs);
    uint8_t total = static_cast<uint8_t>(randomBetween(anim.burstCountMin, anim.burstCountMax));

    LOG_INFO(LogTag::MOTION, "Motion: %u burst(s) in %lu ms", total, static_cast<unsigned long>(offset));

    uint8_t admitted = 0;
    for (uint8_t i = 0; i < total; i++) {
        const Burst* burst = queue_.admit(makeSpec(source, offset), stripLength_, now);
        if (!burst) {
            dropped_ += total - i;
            LOG_DEBUG(LogTag::LED, "Burst queue full, %u motion burst(s) dropped", total - i);
            break;
        }
        admitted++;

        // Next burst follows this one's travel
        if (burst->getBounce() == BounceMode::OneWay) {
            int32_t distance = static_cast<int32_t>(burst->getEndpoint()) - burst->getPosition();
            uint32_t steps = static_cast<uint32_t>(distance < 0 ? -distance : distance);
            offset += steps * burst->getSpeed();
        }
        offset += anim.burstGapMs;
    }
    return admitted;
}

} // namespace tron

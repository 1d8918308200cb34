#ifndef TRON_CONTROL_STATE_H
#define TRON_CONTROL_STATE_H

#include <cstdint>
#include "param_schema.h"

namespace tron {

enum class BounceMode : uint8_t {
    OneWay = 0,
    ForwardBack
};

// Option names, in BounceMode order (matches BOUNCE_OPTIONS)
inline const char* bounceModeName(BounceMode mode) {
    return mode == BounceMode::ForwardBack ? "forward-back" : "one-way";
}

/**
 * AmbientState - Steady lighting the strip returns to when no burst is live
 */
struct AmbientState {
    bool on;
    float brightness;           // 0.0 - 1.0
    uint16_t colorTemperature;  // 140 (cool) - 500 (warm)

    AmbientState()
        : on(paramDesc(ParamId::State).defaultInt != 0)
        , brightness(paramDesc(ParamId::Brightness).defaultFloat)
        , colorTemperature(static_cast<uint16_t>(paramDesc(ParamId::ColorTemp).defaultInt)) {}

    bool operator==(const AmbientState& o) const {
        return on == o.on && brightness == o.brightness && colorTemperature == o.colorTemperature;
    }
    bool operator!=(const AmbientState& o) const { return !(*this == o); }
};

/**
 * AnimationParams - Values a new burst snapshots at admission
 */
struct AnimationParams {
    int32_t trailLength;        // Pixels, or PARAM_VARIABLE
    uint16_t trailMin;          // Range used when trail is variable
    uint16_t trailMax;
    int32_t speedMs;            // ms per step, or PARAM_VARIABLE
    uint16_t speedMinMs;        // Range used when speed is variable
    uint16_t speedMaxMs;
    BounceMode bounce;
    int32_t endpoint;           // Index, or PARAM_VARIABLE
    uint16_t endpointMin;       // Range used when endpoint is variable
    uint16_t endpointMax;
    uint32_t delayMinMs;        // Motion pre-delay range
    uint32_t delayMaxMs;
    uint8_t burstCountMin;      // Bursts per motion trigger
    uint8_t burstCountMax;
    uint32_t burstGapMs;        // Gap between sequential bursts
    float burstBrightness;
    uint8_t burstWarm;
    uint8_t burstCool;
    bool motionEnabled;

    AnimationParams()
        : trailLength(paramDesc(ParamId::TrailLength).defaultInt)
        , trailMin(static_cast<uint16_t>(paramDesc(ParamId::TrailMin).defaultInt))
        , trailMax(static_cast<uint16_t>(paramDesc(ParamId::TrailMax).defaultInt))
        , speedMs(paramDesc(ParamId::Speed).defaultInt)
        , speedMinMs(static_cast<uint16_t>(paramDesc(ParamId::SpeedMin).defaultInt))
        , speedMaxMs(static_cast<uint16_t>(paramDesc(ParamId::SpeedMax).defaultInt))
        , bounce(static_cast<BounceMode>(paramDesc(ParamId::Bounce).defaultInt))
        , endpoint(paramDesc(ParamId::Endpoint).defaultInt)
        , endpointMin(static_cast<uint16_t>(paramDesc(ParamId::EndpointMin).defaultInt))
        , endpointMax(static_cast<uint16_t>(paramDesc(ParamId::EndpointMax).defaultInt))
        , delayMinMs(static_cast<uint32_t>(paramDesc(ParamId::DelayMin).defaultInt))
        , delayMaxMs(static_cast<uint32_t>(paramDesc(ParamId::DelayMax).defaultInt))
        , burstCountMin(static_cast<uint8_t>(paramDesc(ParamId::BurstCountMin).defaultInt))
        , burstCountMax(static_cast<uint8_t>(paramDesc(ParamId::BurstCountMax).defaultInt))
        , burstGapMs(static_cast<uint32_t>(paramDesc(ParamId::BurstGap).defaultInt))
        , burstBrightness(paramDesc(ParamId::BurstBrightness).defaultFloat)
        , burstWarm(static_cast<uint8_t>(paramDesc(ParamId::BurstWarm).defaultInt))
        , burstCool(static_cast<uint8_t>(paramDesc(ParamId::BurstCool).defaultInt))
        , motionEnabled(paramDesc(ParamId::MotionEnabled).defaultInt != 0) {}
};

/**
 * ControlState - Single source of truth for ambient and animation settings
 *
 * Written only by ParamValidator. revision increments on every accepted
 * write so observers can detect change cheaply.
 */
struct ControlState {
    AmbientState ambient;
    AnimationParams anim;
    uint32_t revision = 0;
};

/**
 * StateSnapshot - What the core publishes to state observers
 */
struct StateSnapshot {
    AmbientState ambient;
    bool animating;
    uint32_t revision;
};

/**
 * StateObserver - Collaborator notified after accepted updates and
 * live/idle transitions.
 *
 * Called from inside the render task: implementations must only record
 * the snapshot and do their I/O from their own task.
 */
class StateObserver {
public:
    virtual ~StateObserver() = default;
    virtual void onStateChanged(const StateSnapshot& snapshot) = 0;
};

} // namespace tron

#endif // TRON_CONTROL_STATE_H

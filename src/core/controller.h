#ifndef TRON_CONTROLLER_H
#define TRON_CONTROLLER_H

#include "admission.h"
#include "burst_queue.h"
#include "command_queue.h"
#include "compositor.h"
#include "control_state.h"
#include "motion_trigger.h"
#include "scheduler.h"
#include "validator.h"
#include "../constants.h"

namespace tron {

// Maximum registered state observers
constexpr uint8_t MAX_OBSERVERS = 4;

/**
 * TronController - Context object owning the whole animation core
 *
 * Owns:
 * - Shared control state (ambient + animation parameters)
 * - The burst queue and the compositor's frame buffer
 * - Scheduler, validator, admission and motion trigger
 * - The command queue feeding the validator
 *
 * Every mutation happens inside update() or a direct call from the same
 * cooperative loop, never mid-tick.
 */
class TronController {
public:
    TronController();

    // --- Initialization ---

    void begin(uint16_t ledCount, PixelSink* sink);
    void setLedCount(uint16_t count);
    uint16_t getLedCount() const { return compositor_.getLedCount(); }

    // --- Render task ---

    // Apply queued commands (bounded), then tick once. Returns true while
    // any burst is live.
    bool update(uint32_t now);

    // Render task period: every millisecond while bursts are live so
    // steps land on their deadlines, slow refresh otherwise
    uint32_t getFrameInterval() const {
        return animating_ ? FRAME_INTERVAL_MS : IDLE_FRAME_INTERVAL_MS;
    }

    // --- Command boundary ---

    bool enqueueCommand(const Command& cmd) { return commands_.enqueue(cmd); }

    // Apply one parameter update immediately (also used when restoring
    // persisted state). Turning the strip off clears all bursts; new ones
    // are still admitted and run over the dark strip.
    ApplyResult applyUpdate(ParamId param, const RawValue& raw);
    ApplyResult applyUpdate(const char* name, const RawValue& raw);

    // --- Triggers ---

    uint8_t fire(uint32_t now);
    uint8_t onMotionLevel(bool high, uint32_t now) { return motion_.onLevel(high, now); }
    uint8_t onMotionEdge(uint32_t now) { return motion_.onRisingEdge(now); }

    // Stop all animation; observed on the next tick
    void clearBursts();

    // Clear bursts and push a black frame
    void shutdown();

    // --- State mirror ---

    bool addObserver(StateObserver* observer);
    StateSnapshot snapshot() const;
    bool isAnimating() const { return animating_; }

    // --- Component access ---

    const ControlState& getState() const { return state_; }
    const BurstQueue& getBursts() const { return bursts_; }
    const Compositor& getCompositor() const { return compositor_; }
    const Scheduler& getScheduler() const { return scheduler_; }
    const ParamValidator& getValidator() const { return validator_; }
    const BurstAdmission& getAdmission() const { return admission_; }
    const MotionTrigger& getMotion() const { return motion_; }
    const CommandQueue& getCommands() const { return commands_; }

private:
    void processCommands(uint32_t now);
    void executeCommand(const Command& cmd, uint32_t now);
    void notifyObservers();

    ControlState state_;
    BurstQueue bursts_;
    Compositor compositor_;
    ParamValidator validator_;
    BurstAdmission admission_;
    MotionTrigger motion_;
    Scheduler scheduler_;
    CommandQueue commands_;

    StateObserver* observers_[MAX_OBSERVERS];
    uint8_t observerCount_;
    bool animating_;
};

} // namespace tron

#endif // TRON_CONTROLLER_H

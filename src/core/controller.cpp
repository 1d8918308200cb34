/**
 * TronController implementation
 */

#include "controller.h"
#include "../logging.h"

namespace tron {

TronController::TronController()
    : state_()
    , bursts_()
    , compositor_()
    , validator_(state_)
    , admission_(state_, bursts_)
    , motion_(state_, bursts_, admission_)
    , scheduler_(bursts_, compositor_, state_)
    , commands_()
    , observerCount_(0)
    , animating_(false) {

    for (uint8_t i = 0; i < MAX_OBSERVERS; i++) {
        observers_[i] = nullptr;
    }
}

void TronController::begin(uint16_t ledCount, PixelSink* sink) {
    compositor_.setSink(sink);
    setLedCount(ledCount);
    LOG_INFO(LogTag::LED, "Controller ready: %u LEDs, %u burst slots", getLedCount(), BurstQueue::CAPACITY);
}

void TronController::setLedCount(uint16_t count) {
    compositor_.setLedCount(count);
    admission_.setStripLength(compositor_.getLedCount());
}

bool TronController::update(uint32_t now) {
    processCommands(now);

    bool live = scheduler_.tick(now);

    if (live != animating_) {
        animating_ = live;
        if (!live) {
            LOG_DEBUG(LogTag::LED, "All bursts done, ambient restored");
        }
        notifyObservers();
    }
    return live;
}

void TronController::processCommands(uint32_t now) {
    Command cmd;
    uint8_t processed = 0;
    // Bounded so a command flood can't stretch the frame
    while (processed < MAX_COMMANDS_PER_FRAME && commands_.dequeue(cmd)) {
        executeCommand(cmd, now);
        processed++;
    }
}

void TronController::executeCommand(const Command& cmd, uint32_t now) {
    switch (cmd.type) {
        case CommandType::SetParam:
            applyUpdate(cmd.param, cmd.value);
            break;

        case CommandType::FireBurst:
            fire(now);
            break;

        case CommandType::ClearBursts:
            clearBursts();
            break;
    }
}

ApplyResult TronController::applyUpdate(ParamId param, const RawValue& raw) {
    ApplyResult result = validator_.apply(param, raw);
    if (!result.accepted()) {
        return result;
    }

    if (param == ParamId::State) {
        LOG_INFO(LogTag::LED, "Power -> %s", state_.ambient.on ? "ON" : "OFF");
        if (!state_.ambient.on) {
            clearBursts();
        }
    }

    notifyObservers();
    return result;
}

ApplyResult TronController::applyUpdate(const char* name, const RawValue& raw) {
    ParamId param;
    if (!findParam(name, param)) {
        return validator_.apply(name, raw);
    }
    return applyUpdate(param, raw);
}

uint8_t TronController::fire(uint32_t now) {
    return admission_.admit(BurstSource::Manual, now);
}

void TronController::clearBursts() {
    if (!bursts_.empty()) {
        LOG_DEBUG(LogTag::LED, "Clearing %u burst(s)", bursts_.size());
    }
    bursts_.clear();
}

void TronController::shutdown() {
    clearBursts();
    compositor_.blank();
}

bool TronController::addObserver(StateObserver* observer) {
    if (!observer) return false;

    if (observerCount_ >= MAX_OBSERVERS) {
        LOG_WARN(LogTag::MAIN, "Max state observers reached");
        return false;
    }

    observers_[observerCount_++] = observer;
    return true;
}

StateSnapshot TronController::snapshot() const {
    StateSnapshot snap;
    snap.ambient = state_.ambient;
    snap.animating = animating_;
    snap.revision = state_.revision;
    return snap;
}

void TronController::notifyObservers() {
    StateSnapshot snap = snapshot();
    for (uint8_t i = 0; i < observerCount_; i++) {
        observers_[i]->onStateChanged(snap);
    }
}

} // namespace tron

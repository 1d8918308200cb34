#include "compositor.h"
#include "cct.h"

namespace tron {

Compositor::Compositor()
    : ledCount_(DEFAULT_LED_COUNT)
    , sink_(nullptr)
    , frameCount_(0) {
    fill_solid(frame_, MAX_LED_COUNT, CRGB::Black);
}

void Compositor::setLedCount(uint16_t count) {
    ledCount_ = count < MAX_LED_COUNT ? count : MAX_LED_COUNT;

    // Clear any LEDs beyond new count
    for (uint16_t i = ledCount_; i < MAX_LED_COUNT; i++) {
        frame_[i] = CRGB::Black;
    }
}

void Compositor::render(const AmbientState& ambient, const BurstQueue& queue) {
    fill_solid(frame_, ledCount_, resolveAmbientColor(ambient));

    for (uint8_t i = 0; i < queue.size(); i++) {
        queue[i].render(frame_, ledCount_);
    }

    emit();
}

void Compositor::blank() {
    fill_solid(frame_, ledCount_, CRGB::Black);
    emit();
}

void Compositor::emit() {
    if (sink_) {
        sink_->show(frame_, ledCount_);
    }
    frameCount_++;
}

} // namespace tron

#include "indicator.h"
#include "../constants.h"
#include "../logging.h"

namespace tron {

namespace {
const CRGB MOTION_COLOR(0, 128, 0);
}

Indicator::Indicator() : pixel_(CRGB::Black), controller_(nullptr), enabled_(false), lit_(false) {}

void Indicator::begin(bool enabled) {
    enabled_ = enabled;

    pinMode(INDICATOR_POWER_PIN, OUTPUT);
    digitalWrite(INDICATOR_POWER_PIN, enabled ? HIGH : LOW);
    if (!enabled) {
        LOG_INFO(LogTag::MOTION, "Indicator disabled");
        return;
    }

    controller_ = &FastLED.addLeds<WS2812B, INDICATOR_DATA_PIN, GRB>(&pixel_, 1);
    write(CRGB::Black);
}

void Indicator::setMotion(bool high) {
    if (!enabled_ || high == lit_) return;
    lit_ = high;
    write(high ? MOTION_COLOR : CRGB(CRGB::Black));
}

void Indicator::write(const CRGB& color) {
    pixel_ = color;
    controller_->showLeds(255);
}

} // namespace tron

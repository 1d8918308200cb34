#include "fastled_sink.h"
#include "../logging.h"
#include <string.h>

namespace tron {

FastLedSink::FastLedSink() : controller_(nullptr) {
    fill_solid(leds_, MAX_LED_COUNT, CRGB::Black);
}

void FastLedSink::begin() {
    // Pin is a template argument: changing LED_DATA_PIN needs a rebuild
    controller_ = &FastLED.addLeds<WS2812B, LED_DATA_PIN, GRB>(leds_, MAX_LED_COUNT);

    // Channels carry warm/cool white, not colour: no correction
    controller_->setCorrection(UncorrectedColor);
    controller_->showLeds(0);

    LOG_INFO(LogTag::LED, "Strip on GPIO %d, limit %umA @ %uV", LED_DATA_PIN, LED_MAX_MILLIAMPS, LED_VOLTAGE);
}

void FastLedSink::show(const CRGB* frame, uint16_t count) {
    if (!controller_) return;

    if (count > MAX_LED_COUNT) count = MAX_LED_COUNT;
    memcpy(leds_, frame, count * sizeof(CRGB));
    if (count < MAX_LED_COUNT) {
        fill_solid(leds_ + count, MAX_LED_COUNT - count, CRGB::Black);
    }

    uint8_t brightness = calculate_max_brightness_for_power_vmA(
        leds_, MAX_LED_COUNT, 255, LED_VOLTAGE, LED_MAX_MILLIAMPS);
    controller_->showLeds(brightness);
}

} // namespace tron

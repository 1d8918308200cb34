#ifndef TRON_FASTLED_SINK_H
#define TRON_FASTLED_SINK_H

#include <FastLED.h>
#include "../constants.h"
#include "../core/pixel_sink.h"

namespace tron {

/**
 * FastLedSink - Pushes composed frames to the WS2812B strip
 *
 * Owns the FastLED buffer so the strip can be shown independently of
 * the indicator pixel. Output is power-limited to LED_MAX_MILLIAMPS.
 */
class FastLedSink : public PixelSink {
public:
    FastLedSink();

    void begin();
    void show(const CRGB* frame, uint16_t count) override;

private:
    CRGB leds_[MAX_LED_COUNT];
    CLEDController* controller_;
};

} // namespace tron

#endif // TRON_FASTLED_SINK_H

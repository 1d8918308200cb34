#ifndef TRON_PIXEL_SINK_H
#define TRON_PIXEL_SINK_H

#include <FastLED.h>

namespace tron {

/**
 * PixelSink - Receives one complete frame per render call
 *
 * The frame is only valid for the duration of the call. Implementations
 * must return quickly relative to the frame interval.
 */
class PixelSink {
public:
    virtual ~PixelSink() = default;

    virtual void show(const CRGB* frame, uint16_t count) = 0;
};

} // namespace tron

#endif // TRON_PIXEL_SINK_H

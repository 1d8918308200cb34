#ifndef TRON_COMPOSITOR_H
#define TRON_COMPOSITOR_H

#include <FastLED.h>
#include "burst_queue.h"
#include "control_state.h"
#include "pixel_sink.h"
#include "../constants.h"

namespace tron {

/**
 * Compositor - Builds the output frame for one tick
 *
 * Ambient base color on every pixel, then each active burst's trail
 * added in queue order with saturating per-channel addition. Where
 * overlapping trails saturate a channel the result depends on queue
 * order; that is kept as-is for reproducibility.
 *
 * The frame buffer is owned here and reused every tick.
 */
class Compositor {
public:
    Compositor();

    void setSink(PixelSink* sink) { sink_ = sink; }

    // Clamped to MAX_LED_COUNT; pixels beyond the count are blacked out
    void setLedCount(uint16_t count);
    uint16_t getLedCount() const { return ledCount_; }

    // Compose ambient + bursts and hand the frame to the sink once
    void render(const AmbientState& ambient, const BurstQueue& queue);

    // Black frame (used on shutdown)
    void blank();

    const CRGB* getFrame() const { return frame_; }
    uint32_t getFrameCount() const { return frameCount_; }

private:
    void emit();

    CRGB frame_[MAX_LED_COUNT];
    uint16_t ledCount_;
    PixelSink* sink_;
    uint32_t frameCount_;
};

} // namespace tron

#endif // TRON_COMPOSITOR_H

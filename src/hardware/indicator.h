#ifndef TRON_INDICATOR_H
#define TRON_INDICATOR_H

#include <FastLED.h>

namespace tron {

/**
 * Indicator - Onboard NeoPixel mirroring the PIR line
 *
 * Green while motion is sensed, off otherwise. The pixel has its own
 * power-enable pin which is held high while enabled.
 */
class Indicator {
public:
    Indicator();

    void begin(bool enabled);
    void setMotion(bool high);

private:
    void write(const CRGB& color);

    CRGB pixel_;
    CLEDController* controller_;
    bool enabled_;
    bool lit_;
};

} // namespace tron

#endif // TRON_INDICATOR_H

#ifndef TRON_CCT_H
#define TRON_CCT_H

#include <FastLED.h>
#include "control_state.h"

namespace tron {

// Fixed channel endpoints of the two-channel strip
constexpr uint8_t CCT_WARM_R = 255, CCT_WARM_G = 0, CCT_WARM_B = 0;
constexpr uint8_t CCT_COOL_R = 0, CCT_COOL_G = 255, CCT_COOL_B = 0;

// Drive the warm and cool channels at the given levels
CRGB cctChannels(uint8_t warm, uint8_t cool);

// Warm fraction for a color temperature: 0.0 at 140, 1.0 at 500
float warmFraction(uint16_t colorTemperature);

// Ambient base color: on/off x brightness x linear CCT blend
CRGB resolveAmbientColor(const AmbientState& ambient);

// Head color of a burst created from these parameters
CRGB burstHeadColor(const AnimationParams& anim);

} // namespace tron

#endif // TRON_CCT_H

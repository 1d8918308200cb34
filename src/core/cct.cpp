#include "cct.h"
#include <math.h>

namespace tron {

CRGB cctChannels(uint8_t warm, uint8_t cool) {
    CRGB warmPart(CCT_WARM_R, CCT_WARM_G, CCT_WARM_B);
    CRGB coolPart(CCT_COOL_R, CCT_COOL_G, CCT_COOL_B);
    warmPart.nscale8(warm);
    coolPart.nscale8(cool);
    return warmPart + coolPart;
}

float warmFraction(uint16_t colorTemperature) {
    if (colorTemperature <= COLOR_TEMP_COOLEST) return 0.0f;
    if (colorTemperature >= COLOR_TEMP_WARMEST) return 1.0f;
    return static_cast<float>(colorTemperature - COLOR_TEMP_COOLEST) /
           static_cast<float>(COLOR_TEMP_WARMEST - COLOR_TEMP_COOLEST);
}

CRGB resolveAmbientColor(const AmbientState& ambient) {
    if (!ambient.on) {
        return CRGB::Black;
    }

    float level = 255.0f * ambient.brightness;
    float warm = warmFraction(ambient.colorTemperature);

    return cctChannels(static_cast<uint8_t>(lroundf(level * warm)),
                       static_cast<uint8_t>(lroundf(level * (1.0f - warm))));
}

CRGB burstHeadColor(const AnimationParams& anim) {
    return cctChannels(static_cast<uint8_t>(lroundf(anim.burstWarm * anim.burstBrightness)),
                       static_cast<uint8_t>(lroundf(anim.burstCool * anim.burstBrightness)));
}

} // namespace tron

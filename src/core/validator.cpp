/**
 * ParamValidator implementation
 */

#include "validator.h"
#include "../logging.h"
#include <cmath>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

namespace tron {

namespace {

// Largest magnitude accepted before rounding to int32
constexpr float INT_COERCE_LIMIT = 2.0e9f;

bool parseFloat(const char* s, float& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    float v = strtof(s, &end);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

bool toInt(const RawValue& raw, int32_t& out) {
    float f = 0.0f;
    switch (raw.kind) {
        case RawValue::Kind::Int:
            out = raw.intVal;
            return true;
        case RawValue::Kind::Float:
            f = raw.floatVal;
            break;
        case RawValue::Kind::String:
            if (!parseFloat(raw.str, f)) return false;
            break;
        default:
            return false;
    }

    if (std::isnan(f)) return false;
    if (f > INT_COERCE_LIMIT) f = INT_COERCE_LIMIT;
    if (f < -INT_COERCE_LIMIT) f = -INT_COERCE_LIMIT;
    out = static_cast<int32_t>(std::lround(f));
    return true;
}

bool toFloat(const RawValue& raw, float& out) {
    switch (raw.kind) {
        case RawValue::Kind::Int:
            out = static_cast<float>(raw.intVal);
            return true;
        case RawValue::Kind::Float:
            out = raw.floatVal;
            return !std::isnan(out);
        case RawValue::Kind::String:
            return parseFloat(raw.str, out) && !std::isnan(out);
        default:
            return false;
    }
}

bool toBool(const RawValue& raw, bool& out) {
    switch (raw.kind) {
        case RawValue::Kind::Bool:
            out = raw.boolVal;
            return true;
        case RawValue::Kind::Int:
            if (raw.intVal != 0 && raw.intVal != 1) return false;
            out = raw.intVal == 1;
            return true;
        case RawValue::Kind::String:
            if (strcasecmp(raw.str, "on") == 0 || strcasecmp(raw.str, "true") == 0 ||
                strcmp(raw.str, "1") == 0) {
                out = true;
                return true;
            }
            if (strcasecmp(raw.str, "off") == 0 || strcasecmp(raw.str, "false") == 0 ||
                strcmp(raw.str, "0") == 0) {
                out = false;
                return true;
            }
            return false;
        default:
            return false;
    }
}

// Index of name in "a|b|c", or -1
int32_t matchOption(const char* options, const char* name) {
    if (!options || !name) return -1;
    size_t nameLen = strlen(name);
    int32_t index = 0;
    const char* start = options;
    while (true) {
        const char* bar = strchr(start, '|');
        size_t len = bar ? static_cast<size_t>(bar - start) : strlen(start);
        if (len == nameLen && strncasecmp(start, name, len) == 0) {
            return index;
        }
        if (!bar) return -1;
        start = bar + 1;
        index++;
    }
}

int32_t clampInt(int32_t v, int32_t lo, int32_t hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

} // namespace

const char* applyStatusName(ApplyStatus status) {
    switch (status) {
        case ApplyStatus::Accepted:     return "accepted";
        case ApplyStatus::Clamped:      return "clamped";
        case ApplyStatus::WrongShape:   return "wrong_shape";
        case ApplyStatus::UnknownParam: return "unknown_param";
        default:                        return "unknown";
    }
}

ApplyResult ParamValidator::apply(const char* name, const RawValue& raw) {
    ParamId param;
    if (!findParam(name, param)) {
        LOG_WARN(LogTag::CMD, "Unknown parameter '%s'", name ? name : "(null)");
        return {ApplyStatus::UnknownParam, ParamId::COUNT, ParamValue()};
    }
    return apply(param, raw);
}

ApplyResult ParamValidator::apply(ParamId param, const RawValue& raw) {
    if (param >= ParamId::COUNT) {
        return {ApplyStatus::UnknownParam, param, ParamValue()};
    }

    const ParamDesc& desc = paramDesc(param);
    ApplyResult result = {ApplyStatus::Accepted, param, ParamValue()};
    bool shapeOk = false;

    switch (desc.type) {
        case ParamType::Int: {
            int32_t v = 0;
            shapeOk = toInt(raw, v);
            if (shapeOk) {
                int32_t clamped = clampInt(v, desc.minInt, desc.maxInt);
                if (clamped != v) result.status = ApplyStatus::Clamped;
                result.value = ParamValue::ofInt(ParamType::Int, clamped);
            }
            break;
        }

        case ParamType::Float: {
            float v = 0.0f;
            shapeOk = toFloat(raw, v);
            if (shapeOk) {
                float clamped = v < desc.minFloat ? desc.minFloat : (v > desc.maxFloat ? desc.maxFloat : v);
                if (clamped != v) result.status = ApplyStatus::Clamped;
                result.value = ParamValue::ofFloat(clamped);
            }
            break;
        }

        case ParamType::Bool: {
            bool v = false;
            shapeOk = toBool(raw, v);
            if (shapeOk) result.value = ParamValue::ofBool(v);
            break;
        }

        case ParamType::Enum: {
            int32_t v = -1;
            if (raw.kind == RawValue::Kind::String) {
                v = matchOption(desc.enumOptions, raw.str);
                shapeOk = v >= 0;
            } else if (raw.kind == RawValue::Kind::Int) {
                v = raw.intVal;
                shapeOk = true;
            }
            if (shapeOk) {
                int32_t clamped = clampInt(v, desc.minInt, desc.maxInt);
                if (clamped != v) result.status = ApplyStatus::Clamped;
                result.value = ParamValue::ofInt(ParamType::Enum, clamped);
            }
            break;
        }

        case ParamType::Variable: {
            if (raw.kind == RawValue::Kind::String && strcasecmp(raw.str, "variable") == 0) {
                shapeOk = true;
                result.value = ParamValue::ofInt(ParamType::Variable, PARAM_VARIABLE);
                break;
            }
            int32_t v = 0;
            shapeOk = toInt(raw, v);
            if (shapeOk) {
                int32_t clamped = clampInt(v, desc.minInt, desc.maxInt);
                if (clamped != v) result.status = ApplyStatus::Clamped;
                result.value = ParamValue::ofInt(ParamType::Variable, clamped);
            }
            break;
        }
    }

    if (!shapeOk) {
        LOG_WARN(LogTag::CMD, "Rejected %s: wrong shape", desc.id);
        result.status = ApplyStatus::WrongShape;
        result.value = read(param);
        return result;
    }

    store(param, result.value);
    state_.revision++;

    if (result.status == ApplyStatus::Clamped) {
        LOG_DEBUG(LogTag::CMD, "%s clamped to range", desc.id);
    }
    return result;
}

void ParamValidator::store(ParamId param, const ParamValue& value) {
    AmbientState& ambient = state_.ambient;
    AnimationParams& anim = state_.anim;

    switch (param) {
        case ParamId::State:           ambient.on = value.boolVal; break;
        case ParamId::Brightness:      ambient.brightness = value.floatVal; break;
        case ParamId::ColorTemp:       ambient.colorTemperature = static_cast<uint16_t>(value.intVal); break;
        case ParamId::TrailLength:     anim.trailLength = value.intVal; break;
        case ParamId::TrailMin:        anim.trailMin = static_cast<uint16_t>(value.intVal); break;
        case ParamId::TrailMax:        anim.trailMax = static_cast<uint16_t>(value.intVal); break;
        case ParamId::Speed:           anim.speedMs = value.intVal; break;
        case ParamId::SpeedMin:        anim.speedMinMs = static_cast<uint16_t>(value.intVal); break;
        case ParamId::SpeedMax:        anim.speedMaxMs = static_cast<uint16_t>(value.intVal); break;
        case ParamId::Bounce:          anim.bounce = static_cast<BounceMode>(value.intVal); break;
        case ParamId::Endpoint:        anim.endpoint = value.intVal; break;
        case ParamId::EndpointMin:     anim.endpointMin = static_cast<uint16_t>(value.intVal); break;
        case ParamId::EndpointMax:     anim.endpointMax = static_cast<uint16_t>(value.intVal); break;
        case ParamId::DelayMin:        anim.delayMinMs = static_cast<uint32_t>(value.intVal); break;
        case ParamId::DelayMax:        anim.delayMaxMs = static_cast<uint32_t>(value.intVal); break;
        case ParamId::BurstCountMin:   anim.burstCountMin = static_cast<uint8_t>(value.intVal); break;
        case ParamId::BurstCountMax:   anim.burstCountMax = static_cast<uint8_t>(value.intVal); break;
        case ParamId::BurstGap:        anim.burstGapMs = static_cast<uint32_t>(value.intVal); break;
        case ParamId::BurstBrightness: anim.burstBrightness = value.floatVal; break;
        case ParamId::BurstWarm:       anim.burstWarm = static_cast<uint8_t>(value.intVal); break;
        case ParamId::BurstCool:       anim.burstCool = static_cast<uint8_t>(value.intVal); break;
        case ParamId::MotionEnabled:   anim.motionEnabled = value.boolVal; break;
        case ParamId::COUNT:           break;
    }
}

ParamValue ParamValidator::read(ParamId param) const {
    const AmbientState& ambient = state_.ambient;
    const AnimationParams& anim = state_.anim;

    switch (param) {
        case ParamId::State:           return ParamValue::ofBool(ambient.on);
        case ParamId::Brightness:      return ParamValue::ofFloat(ambient.brightness);
        case ParamId::ColorTemp:       return ParamValue::ofInt(ParamType::Int, ambient.colorTemperature);
        case ParamId::TrailLength:     return ParamValue::ofInt(ParamType::Variable, anim.trailLength);
        case ParamId::TrailMin:        return ParamValue::ofInt(ParamType::Int, anim.trailMin);
        case ParamId::TrailMax:        return ParamValue::ofInt(ParamType::Int, anim.trailMax);
        case ParamId::Speed:           return ParamValue::ofInt(ParamType::Variable, anim.speedMs);
        case ParamId::SpeedMin:        return ParamValue::ofInt(ParamType::Int, anim.speedMinMs);
        case ParamId::SpeedMax:        return ParamValue::ofInt(ParamType::Int, anim.speedMaxMs);
        case ParamId::Bounce:          return ParamValue::ofInt(ParamType::Enum, static_cast<int32_t>(anim.bounce));
        case ParamId::Endpoint:        return ParamValue::ofInt(ParamType::Variable, anim.endpoint);
        case ParamId::EndpointMin:     return ParamValue::ofInt(ParamType::Int, anim.endpointMin);
        case ParamId::EndpointMax:     return ParamValue::ofInt(ParamType::Int, anim.endpointMax);
        case ParamId::DelayMin:        return ParamValue::ofInt(ParamType::Int, static_cast<int32_t>(anim.delayMinMs));
        case ParamId::DelayMax:        return ParamValue::ofInt(ParamType::Int, static_cast<int32_t>(anim.delayMaxMs));
        case ParamId::BurstCountMin:   return ParamValue::ofInt(ParamType::Int, anim.burstCountMin);
        case ParamId::BurstCountMax:   return ParamValue::ofInt(ParamType::Int, anim.burstCountMax);
        case ParamId::BurstGap:        return ParamValue::ofInt(ParamType::Int, static_cast<int32_t>(anim.burstGapMs));
        case ParamId::BurstBrightness: return ParamValue::ofFloat(anim.burstBrightness);
        case ParamId::BurstWarm:       return ParamValue::ofInt(ParamType::Int, anim.burstWarm);
        case ParamId::BurstCool:       return ParamValue::ofInt(ParamType::Int, anim.burstCool);
        case ParamId::MotionEnabled:   return ParamValue::ofBool(anim.motionEnabled);
        case ParamId::COUNT:           break;
    }
    return ParamValue();
}

void ParamValidator::resetDefaults() {
    state_.ambient = AmbientState();
    state_.anim = AnimationParams();
    state_.revision++;
}

} // namespace tron

#ifndef TRON_PARAM_SCHEMA_H
#define TRON_PARAM_SCHEMA_H

#include <cstdint>
#include <cstring>
#include "../constants.h"

namespace tron {

// ============================================
// Parameter identifiers (closed set)
// ============================================

enum class ParamId : uint8_t {
    // Ambient state
    State = 0,
    Brightness,
    ColorTemp,

    // Burst animation
    TrailLength,
    TrailMin,
    TrailMax,
    Speed,
    SpeedMin,
    SpeedMax,
    Bounce,
    Endpoint,
    EndpointMin,
    EndpointMax,
    DelayMin,
    DelayMax,
    BurstCountMin,
    BurstCountMax,
    BurstGap,
    BurstBrightness,
    BurstWarm,
    BurstCool,
    MotionEnabled,

    COUNT
};

constexpr uint8_t PARAM_COUNT = static_cast<uint8_t>(ParamId::COUNT);

// Sentinel stored for "variable": drawn per burst from the matching min/max pair
constexpr int32_t PARAM_VARIABLE = -1;

enum class ParamType : uint8_t {
    Int,        // Integer range
    Float,      // 0.0-1.0 style fraction
    Bool,       // Toggle
    Enum,       // Named options
    Variable,   // Integer, or "variable" to draw from a min/max range
};

/**
 * Single parameter descriptor - lives in flash, no heap allocation.
 *
 * The validator enforces type and range from this table; the console
 * uses the id for name lookup and JSON keys.
 */
struct ParamDesc {
    ParamId param;
    const char* id;           // Wire name: "trail_length"
    ParamType type;

    int32_t defaultInt;       // Default for Int/Bool/Enum/Variable
    int32_t minInt;
    int32_t maxInt;
    float defaultFloat;
    float minFloat;
    float maxFloat;
    const char* enumOptions;  // For Enum: "option0|option1"

    static constexpr ParamDesc Int(ParamId p, const char* id, int32_t def, int32_t min, int32_t max) {
        return {p, id, ParamType::Int, def, min, max, 0.0f, 0.0f, 0.0f, nullptr};
    }

    static constexpr ParamDesc Float(ParamId p, const char* id, float def, float min = 0.0f, float max = 1.0f) {
        return {p, id, ParamType::Float, 0, 0, 0, def, min, max, nullptr};
    }

    static constexpr ParamDesc Bool(ParamId p, const char* id, bool def) {
        return {p, id, ParamType::Bool, def ? 1 : 0, 0, 1, 0.0f, 0.0f, 0.0f, nullptr};
    }

    static constexpr ParamDesc Enum(ParamId p, const char* id, const char* options, int32_t optionCount, int32_t def = 0) {
        return {p, id, ParamType::Enum, def, 0, optionCount - 1, 0.0f, 0.0f, 0.0f, options};
    }

    static constexpr ParamDesc Variable(ParamId p, const char* id, int32_t def, int32_t min, int32_t max) {
        return {p, id, ParamType::Variable, def, min, max, 0.0f, 0.0f, 0.0f, nullptr};
    }
};

// Bounce mode option names, in BounceMode order
constexpr const char* BOUNCE_OPTIONS = "one-way|forward-back";

// Descriptor table, indexed by ParamId
constexpr ParamDesc PARAM_TABLE[PARAM_COUNT] = {
    ParamDesc::Bool(ParamId::State, "state", false),
    ParamDesc::Float(ParamId::Brightness, "brightness", 0.5f),
    ParamDesc::Int(ParamId::ColorTemp, "color_temp", 320, COLOR_TEMP_COOLEST, COLOR_TEMP_WARMEST),

    ParamDesc::Variable(ParamId::TrailLength, "trail_length", 3, 1, MAX_LED_COUNT),
    ParamDesc::Int(ParamId::TrailMin, "trail_min", 1, 1, MAX_LED_COUNT),
    ParamDesc::Int(ParamId::TrailMax, "trail_max", 3, 1, MAX_LED_COUNT),
    ParamDesc::Variable(ParamId::Speed, "speed", 8, 1, MAX_SPEED_MS),
    ParamDesc::Int(ParamId::SpeedMin, "speed_min", 5, 1, MAX_SPEED_MS),
    ParamDesc::Int(ParamId::SpeedMax, "speed_max", 10, 1, MAX_SPEED_MS),
    ParamDesc::Enum(ParamId::Bounce, "bounce", BOUNCE_OPTIONS, 2, 0),
    ParamDesc::Variable(ParamId::Endpoint, "endpoint", 57, 0, MAX_LED_COUNT - 1),
    ParamDesc::Int(ParamId::EndpointMin, "endpoint_min", 57, 0, MAX_LED_COUNT - 1),
    ParamDesc::Int(ParamId::EndpointMax, "endpoint_max", 59, 0, MAX_LED_COUNT - 1),
    ParamDesc::Int(ParamId::DelayMin, "delay_min", 5000, 0, MAX_DELAY_MS),
    ParamDesc::Int(ParamId::DelayMax, "delay_max", 20000, 0, MAX_DELAY_MS),
    ParamDesc::Int(ParamId::BurstCountMin, "burst_count_min", 1, 1, MAX_BURSTS),
    ParamDesc::Int(ParamId::BurstCountMax, "burst_count_max", 3, 1, MAX_BURSTS),
    ParamDesc::Int(ParamId::BurstGap, "burst_gap", 0, 0, MAX_DELAY_MS),
    ParamDesc::Float(ParamId::BurstBrightness, "burst_brightness", 0.25f),
    ParamDesc::Int(ParamId::BurstWarm, "burst_warm", 255, 0, 255),
    ParamDesc::Int(ParamId::BurstCool, "burst_cool", 0, 0, 255),
    ParamDesc::Bool(ParamId::MotionEnabled, "motion", true),
};

inline const ParamDesc& paramDesc(ParamId param) {
    return PARAM_TABLE[static_cast<uint8_t>(param)];
}

inline const char* paramName(ParamId param) {
    return param < ParamId::COUNT ? paramDesc(param).id : "unknown";
}

// Find param by wire name (returns false for unknown names)
inline bool findParam(const char* id, ParamId& out) {
    if (!id) return false;
    for (uint8_t i = 0; i < PARAM_COUNT; i++) {
        if (strcmp(PARAM_TABLE[i].id, id) == 0) {
            out = PARAM_TABLE[i].param;
            return true;
        }
    }
    return false;
}

/**
 * Typed parameter value, as stored/reported.
 */
struct ParamValue {
    ParamType type;
    union {
        int32_t intVal;     // Int, Enum, Variable (PARAM_VARIABLE allowed)
        float floatVal;
        bool boolVal;
    };

    ParamValue() : type(ParamType::Int), intVal(0) {}

    static ParamValue ofInt(ParamType t, int32_t v) {
        ParamValue pv;
        pv.type = t;
        pv.intVal = v;
        return pv;
    }

    static ParamValue ofFloat(float v) {
        ParamValue pv;
        pv.type = ParamType::Float;
        pv.floatVal = v;
        return pv;
    }

    static ParamValue ofBool(bool v) {
        ParamValue pv;
        pv.type = ParamType::Bool;
        pv.boolVal = v;
        return pv;
    }
};

} // namespace tron

#endif // TRON_PARAM_SCHEMA_H

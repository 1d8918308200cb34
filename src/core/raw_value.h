#ifndef TRON_RAW_VALUE_H
#define TRON_RAW_VALUE_H

#include <cstdint>
#include <cstring>

namespace tron {

constexpr size_t MAX_RAW_STRING = 16;

/**
 * RawValue - Unvalidated input as it arrived from a command source
 *
 * Fixed-size so it can travel through the command queue. Shapes that
 * carry no usable scalar (objects, arrays, null, over-long strings)
 * arrive as Invalid and are rejected by the validator.
 */
struct RawValue {
    enum class Kind : uint8_t {
        Invalid = 0,
        Bool,
        Int,
        Float,
        String
    };

    Kind kind;
    union {
        bool boolVal;
        int32_t intVal;
        float floatVal;
    };
    char str[MAX_RAW_STRING];

    RawValue() : kind(Kind::Invalid), intVal(0) { str[0] = '\0'; }

    static RawValue invalid() { return RawValue(); }

    static RawValue fromBool(bool v) {
        RawValue raw;
        raw.kind = Kind::Bool;
        raw.boolVal = v;
        return raw;
    }

    static RawValue fromInt(int32_t v) {
        RawValue raw;
        raw.kind = Kind::Int;
        raw.intVal = v;
        return raw;
    }

    static RawValue fromFloat(float v) {
        RawValue raw;
        raw.kind = Kind::Float;
        raw.floatVal = v;
        return raw;
    }

    // Strings that don't fit are treated as malformed
    static RawValue fromString(const char* s) {
        RawValue raw;
        if (!s || strlen(s) >= MAX_RAW_STRING) {
            return raw;
        }
        raw.kind = Kind::String;
        strncpy(raw.str, s, MAX_RAW_STRING);
        raw.str[MAX_RAW_STRING - 1] = '\0';
        return raw;
    }
};

} // namespace tron

#endif // TRON_RAW_VALUE_H

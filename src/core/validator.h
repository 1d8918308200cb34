#ifndef TRON_VALIDATOR_H
#define TRON_VALIDATOR_H

#include "control_state.h"
#include "param_schema.h"
#include "raw_value.h"

namespace tron {

enum class ApplyStatus : uint8_t {
    Accepted = 0,   // Stored as given
    Clamped,        // Out of range, stored at the nearest bound
    WrongShape,     // Not coercible to the declared type, prior value kept
    UnknownParam    // Name not in the parameter table
};

const char* applyStatusName(ApplyStatus status);

struct ApplyResult {
    ApplyStatus status;
    ParamId param;
    ParamValue value;       // Stored value when accepted or clamped

    bool accepted() const {
        return status == ApplyStatus::Accepted || status == ApplyStatus::Clamped;
    }
};

/**
 * ParamValidator - The only writer of ControlState
 *
 * Enforces each parameter's declared type and range at the write
 * boundary so readers never re-check:
 * - numeric input outside the range is clamped to the nearest bound
 * - input of the wrong shape is rejected and the old value kept
 * - unknown names are rejected
 */
class ParamValidator {
public:
    explicit ParamValidator(ControlState& state) : state_(state) {}

    ApplyResult apply(ParamId param, const RawValue& raw);
    ApplyResult apply(const char* name, const RawValue& raw);

    // Current stored value
    ParamValue read(ParamId param) const;

    // Reset every parameter to its declared default
    void resetDefaults();

private:
    void store(ParamId param, const ParamValue& value);

    ControlState& state_;
};

} // namespace tron

#endif // TRON_VALIDATOR_H

#ifndef TRON_JSON_CODEC_H
#define TRON_JSON_CODEC_H

#include <ArduinoJson.h>
#include "../constants.h"
#include "../core/command_queue.h"
#include "../core/control_state.h"
#include "../core/raw_value.h"
#include "../core/validator.h"

namespace tron {

class TronController;

constexpr uint8_t MAX_LINE_COMMANDS = 24;
constexpr uint8_t MAX_LINE_ERRORS = 4;
constexpr size_t MAX_KEY_LENGTH = 24;

// Console requests that are answered directly rather than queued
enum class ConsoleAction : uint8_t {
    None = 0,
    Status,     // Print state mirror
    Params,     // Print all parameters
    Config,     // Print runtime config
    SetConfig,  // {"config":{...}}: update and store runtime config
    Save        // Persist state now
};

/**
 * ParsedLine - One console line decoded into commands
 *
 * Accepts either a JSON object ({"brightness":0.6,"fire":true}) or a
 * bare word (fire, clear, status, params, config, save).
 */
struct ParsedLine {
    bool valid = false;
    ConsoleAction action = ConsoleAction::None;

    Command commands[MAX_LINE_COMMANDS];
    uint8_t commandCount = 0;

    // Object given with SetConfig, re-serialized
    char configJson[CONSOLE_LINE_SIZE];

    // Keys that matched no parameter or action
    char unknownKeys[MAX_LINE_ERRORS][MAX_KEY_LENGTH];
    uint8_t unknownCount = 0;
};

// Convert a JSON scalar to a raw value (objects/arrays/null -> Invalid)
RawValue rawFromJson(JsonVariantConst value);

// Decode one console line
bool parseLine(const char* line, ParsedLine& out);

// Stored value as JSON (enum -> option name, PARAM_VARIABLE -> "variable")
void paramValueToJson(ParamId param, const ParamValue& value, JsonVariant dst);

// {"state":"ON","brightness":0.6,"color_temp":320,"animating":false}
void stateToJson(const StateSnapshot& snapshot, JsonDocument& doc);

// Every parameter keyed by its wire name
void paramsToJson(const ParamValidator& validator, JsonDocument& doc);

// Apply every recognised key through the validator; returns accepted count
uint8_t applyParamsJson(TronController& controller, JsonObjectConst obj);

} // namespace tron

#endif // TRON_JSON_CODEC_H

#include "json_codec.h"
#include "../core/controller.h"
#include "../constants.h"
#include "../logging.h"
#include <ctype.h>
#include <string.h>
#include <strings.h>

namespace tron {

namespace {

bool isTruthy(JsonVariantConst value) {
    if (value.isNull()) return true;    // {"fire":null} still means fire
    if (value.is<bool>()) return value.as<bool>();
    if (value.is<int>()) return value.as<int>() != 0;
    return false;
}

void addUnknown(ParsedLine& out, const char* key) {
    if (out.unknownCount >= MAX_LINE_ERRORS) return;
    strncpy(out.unknownKeys[out.unknownCount], key, MAX_KEY_LENGTH - 1);
    out.unknownKeys[out.unknownCount][MAX_KEY_LENGTH - 1] = '\0';
    out.unknownCount++;
}

bool addCommand(ParsedLine& out, const Command& cmd) {
    if (out.commandCount >= MAX_LINE_COMMANDS) {
        LOG_WARN(LogTag::CMD, "Too many commands on one line, rest ignored");
        return false;
    }
    out.commands[out.commandCount++] = cmd;
    return true;
}

bool parseObject(const char* line, ParsedLine& out) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, line);
    if (err) {
        LOG_WARN(LogTag::CMD, "Invalid JSON: %s", err.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        return false;
    }

    for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
        const char* key = kv.key().c_str();
        ParamId param;

        if (strcmp(key, "fire") == 0) {
            if (isTruthy(kv.value())) addCommand(out, Command::fire());
        } else if (strcmp(key, "clear") == 0) {
            if (isTruthy(kv.value())) addCommand(out, Command::clear());
        } else if (strcmp(key, "config") == 0 && kv.value().is<JsonObjectConst>()) {
            serializeJson(kv.value(), out.configJson, sizeof(out.configJson));
            out.action = ConsoleAction::SetConfig;
        } else if (findParam(key, param)) {
            addCommand(out, Command::setParam(param, rawFromJson(kv.value())));
        } else {
            addUnknown(out, key);
        }
    }
    return true;
}

bool parseWord(const char* word, ParsedLine& out) {
    if (strcasecmp(word, "fire") == 0) return addCommand(out, Command::fire());
    if (strcasecmp(word, "clear") == 0) return addCommand(out, Command::clear());
    if (strcasecmp(word, "on") == 0 || strcasecmp(word, "off") == 0) {
        return addCommand(out, Command::setParam(ParamId::State, RawValue::fromString(word)));
    }
    if (strcasecmp(word, "status") == 0) { out.action = ConsoleAction::Status; return true; }
    if (strcasecmp(word, "params") == 0) { out.action = ConsoleAction::Params; return true; }
    if (strcasecmp(word, "config") == 0) { out.action = ConsoleAction::Config; return true; }
    if (strcasecmp(word, "save") == 0)   { out.action = ConsoleAction::Save; return true; }

    addUnknown(out, word);
    return false;
}

} // namespace

RawValue rawFromJson(JsonVariantConst value) {
    if (value.is<bool>()) return RawValue::fromBool(value.as<bool>());
    if (value.is<int32_t>()) return RawValue::fromInt(value.as<int32_t>());
    if (value.is<float>()) return RawValue::fromFloat(value.as<float>());
    if (value.is<const char*>()) return RawValue::fromString(value.as<const char*>());
    return RawValue::invalid();
}

bool parseLine(const char* line, ParsedLine& out) {
    out.valid = false;
    out.action = ConsoleAction::None;
    out.commandCount = 0;
    out.unknownCount = 0;
    out.configJson[0] = '\0';

    if (!line) return false;

    // Trim surrounding whitespace
    char buffer[CONSOLE_LINE_SIZE];
    while (*line && isspace(static_cast<unsigned char>(*line))) line++;
    strncpy(buffer, line, sizeof(buffer) - 1);
    buffer[sizeof(buffer) - 1] = '\0';
    size_t len = strlen(buffer);
    while (len > 0 && isspace(static_cast<unsigned char>(buffer[len - 1]))) {
        buffer[--len] = '\0';
    }
    if (len == 0) return false;

    out.valid = buffer[0] == '{' ? parseObject(buffer, out) : parseWord(buffer, out);
    return out.valid;
}

void paramValueToJson(ParamId param, const ParamValue& value, JsonVariant dst) {
    switch (value.type) {
        case ParamType::Bool:
            dst.set(value.boolVal);
            break;
        case ParamType::Float:
            dst.set(value.floatVal);
            break;
        case ParamType::Enum:
            if (param == ParamId::Bounce) {
                dst.set(bounceModeName(static_cast<BounceMode>(value.intVal)));
            } else {
                dst.set(value.intVal);
            }
            break;
        case ParamType::Variable:
            if (value.intVal == PARAM_VARIABLE) {
                dst.set("variable");
            } else {
                dst.set(value.intVal);
            }
            break;
        case ParamType::Int:
            dst.set(value.intVal);
            break;
    }
}

void stateToJson(const StateSnapshot& snapshot, JsonDocument& doc) {
    doc["state"] = snapshot.ambient.on ? "ON" : "OFF";
    doc["brightness"] = snapshot.ambient.brightness;
    doc["color_temp"] = snapshot.ambient.colorTemperature;
    doc["animating"] = snapshot.animating;
    doc["revision"] = snapshot.revision;
}

void paramsToJson(const ParamValidator& validator, JsonDocument& doc) {
    for (uint8_t i = 0; i < PARAM_COUNT; i++) {
        ParamId param = static_cast<ParamId>(i);
        paramValueToJson(param, validator.read(param), doc[paramName(param)].to<JsonVariant>());
    }
}

uint8_t applyParamsJson(TronController& controller, JsonObjectConst obj) {
    uint8_t accepted = 0;
    for (JsonPairConst kv : obj) {
        ParamId param;
        if (!findParam(kv.key().c_str(), param)) {
            LOG_WARN(LogTag::STORAGE, "Ignoring unknown key '%s'", kv.key().c_str());
            continue;
        }
        if (controller.applyUpdate(param, rawFromJson(kv.value())).accepted()) {
            accepted++;
        }
    }
    return accepted;
}

} // namespace tron

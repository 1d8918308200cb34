/**
 * Console JSON codec tests
 *
 * - console line decoding (JSON objects and bare words)
 * - JSON scalar -> RawValue shapes
 * - parameter and state encoding
 * - restoring persisted parameters through the validator
 */

#include <unity.h>
#include <ArduinoJson.h>
#include <string.h>
#include "test_support.h"
#include "console/json_codec.h"
#include "core/controller.h"

using namespace tron;

void test_codec_json_line_to_commands() {
    ParsedLine parsed;
    TEST_ASSERT_TRUE(parseLine("{\"state\":\"ON\",\"brightness\":0.6,\"fire\":true}", parsed));
    TEST_ASSERT_EQUAL_UINT8(3, parsed.commandCount);
    TEST_ASSERT_EQUAL(ConsoleAction::None, parsed.action);

    TEST_ASSERT_EQUAL(CommandType::SetParam, parsed.commands[0].type);
    TEST_ASSERT_EQUAL(ParamId::State, parsed.commands[0].param);
    TEST_ASSERT_EQUAL(RawValue::Kind::String, parsed.commands[0].value.kind);
    TEST_ASSERT_EQUAL_STRING("ON", parsed.commands[0].value.str);

    TEST_ASSERT_EQUAL(ParamId::Brightness, parsed.commands[1].param);
    TEST_ASSERT_EQUAL(RawValue::Kind::Float, parsed.commands[1].value.kind);
    TEST_ASSERT_EQUAL_FLOAT(0.6f, parsed.commands[1].value.floatVal);

    TEST_ASSERT_EQUAL(CommandType::FireBurst, parsed.commands[2].type);
}

void test_codec_unknown_keys_reported() {
    ParsedLine parsed;
    TEST_ASSERT_TRUE(parseLine("{\"sparkle\":1,\"speed\":20}", parsed));
    TEST_ASSERT_EQUAL_UINT8(1, parsed.commandCount);
    TEST_ASSERT_EQUAL(ParamId::Speed, parsed.commands[0].param);
    TEST_ASSERT_EQUAL_UINT8(1, parsed.unknownCount);
    TEST_ASSERT_EQUAL_STRING("sparkle", parsed.unknownKeys[0]);
}

void test_codec_bare_words() {
    ParsedLine parsed;
    TEST_ASSERT_TRUE(parseLine("  fire\r", parsed));
    TEST_ASSERT_EQUAL_UINT8(1, parsed.commandCount);
    TEST_ASSERT_EQUAL(CommandType::FireBurst, parsed.commands[0].type);

    TEST_ASSERT_TRUE(parseLine("CLEAR", parsed));
    TEST_ASSERT_EQUAL(CommandType::ClearBursts, parsed.commands[0].type);

    TEST_ASSERT_TRUE(parseLine("status", parsed));
    TEST_ASSERT_EQUAL_UINT8(0, parsed.commandCount);
    TEST_ASSERT_EQUAL(ConsoleAction::Status, parsed.action);

    TEST_ASSERT_TRUE(parseLine("save", parsed));
    TEST_ASSERT_EQUAL(ConsoleAction::Save, parsed.action);

    TEST_ASSERT_TRUE(parseLine("off", parsed));
    TEST_ASSERT_EQUAL(ParamId::State, parsed.commands[0].param);
}

void test_codec_rejects_garbage() {
    ParsedLine parsed;
    TEST_ASSERT_FALSE(parseLine("", parsed));
    TEST_ASSERT_FALSE(parseLine("   ", parsed));
    TEST_ASSERT_FALSE(parseLine("{\"speed\":", parsed));
    TEST_ASSERT_FALSE(parseLine("dance", parsed));
    TEST_ASSERT_EQUAL_UINT8(1, parsed.unknownCount);
    TEST_ASSERT_FALSE(parseLine(nullptr, parsed));
}

void test_codec_fire_false_is_ignored() {
    ParsedLine parsed;
    TEST_ASSERT_TRUE(parseLine("{\"fire\":false}", parsed));
    TEST_ASSERT_EQUAL_UINT8(0, parsed.commandCount);
}

void test_codec_config_object_is_kept_for_console() {
    ParsedLine out;
    TEST_ASSERT_TRUE(parseLine("{\"config\":{\"ledCount\":120},\"fire\":true}", out));
    TEST_ASSERT_EQUAL(static_cast<int>(ConsoleAction::SetConfig), static_cast<int>(out.action));
    TEST_ASSERT_EQUAL_STRING("{\"ledCount\":120}", out.configJson);
    TEST_ASSERT_EQUAL_UINT8(1, out.commandCount);

    // Scalar config is not an object
    TEST_ASSERT_TRUE(parseLine("{\"config\":5}", out));
    TEST_ASSERT_EQUAL(static_cast<int>(ConsoleAction::None), static_cast<int>(out.action));
    TEST_ASSERT_EQUAL_UINT8(1, out.unknownCount);
}

void test_codec_raw_value_shapes() {
    JsonDocument doc;
    deserializeJson(doc, "{\"b\":true,\"i\":42,\"f\":0.25,\"s\":\"variable\",\"a\":[1,2],\"o\":{},\"n\":null}");

    TEST_ASSERT_EQUAL(RawValue::Kind::Bool, rawFromJson(doc["b"]).kind);
    TEST_ASSERT_EQUAL(RawValue::Kind::Int, rawFromJson(doc["i"]).kind);
    TEST_ASSERT_EQUAL_INT32(42, rawFromJson(doc["i"]).intVal);
    TEST_ASSERT_EQUAL(RawValue::Kind::Float, rawFromJson(doc["f"]).kind);
    TEST_ASSERT_EQUAL(RawValue::Kind::String, rawFromJson(doc["s"]).kind);
    TEST_ASSERT_EQUAL(RawValue::Kind::Invalid, rawFromJson(doc["a"]).kind);
    TEST_ASSERT_EQUAL(RawValue::Kind::Invalid, rawFromJson(doc["o"]).kind);
    TEST_ASSERT_EQUAL(RawValue::Kind::Invalid, rawFromJson(doc["n"]).kind);
}

void test_codec_params_use_wire_names() {
    ControlState state;
    ParamValidator validator(state);
    validator.apply(ParamId::Bounce, RawValue::fromString("forward-back"));
    validator.apply(ParamId::Endpoint, RawValue::fromString("variable"));

    JsonDocument doc;
    paramsToJson(validator, doc);

    TEST_ASSERT_EQUAL_STRING("forward-back", doc["bounce"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("variable", doc["endpoint"].as<const char*>());
    TEST_ASSERT_FALSE(doc["state"].as<bool>());
    TEST_ASSERT_EQUAL_INT(320, doc["color_temp"].as<int>());
    TEST_ASSERT_EQUAL_INT(57, doc["endpoint_min"].as<int>());
    TEST_ASSERT_TRUE(doc["motion"].as<bool>());
    TEST_ASSERT_EQUAL(PARAM_COUNT, doc.as<JsonObjectConst>().size());
}

void test_codec_state_mirror() {
    StateSnapshot snap;
    snap.ambient.on = true;
    snap.ambient.brightness = 0.6f;
    snap.ambient.colorTemperature = 320;
    snap.animating = true;
    snap.revision = 7;

    JsonDocument doc;
    stateToJson(snap, doc);

    TEST_ASSERT_EQUAL_STRING("ON", doc["state"].as<const char*>());
    TEST_ASSERT_EQUAL_FLOAT(0.6f, doc["brightness"].as<float>());
    TEST_ASSERT_EQUAL_INT(320, doc["color_temp"].as<int>());
    TEST_ASSERT_TRUE(doc["animating"].as<bool>());
}

void test_codec_restore_goes_through_validator() {
    TronController controller;
    controller.begin(60, nullptr);

    JsonDocument doc;
    deserializeJson(doc, "{\"brightness\":2.0,\"bounce\":\"forward-back\",\"speed\":\"fast\",\"bogus\":1}");

    uint8_t accepted = applyParamsJson(controller, doc.as<JsonObjectConst>());
    TEST_ASSERT_EQUAL_UINT8(2, accepted);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, controller.getState().ambient.brightness);
    TEST_ASSERT_EQUAL(BounceMode::ForwardBack, controller.getState().anim.bounce);
    TEST_ASSERT_EQUAL_UINT16(8, controller.getState().anim.speedMs);
}

void run_json_codec_tests() {
    RUN_TEST(test_codec_json_line_to_commands);
    RUN_TEST(test_codec_unknown_keys_reported);
    RUN_TEST(test_codec_bare_words);
    RUN_TEST(test_codec_rejects_garbage);
    RUN_TEST(test_codec_fire_false_is_ignored);
    RUN_TEST(test_codec_config_object_is_kept_for_console);
    RUN_TEST(test_codec_raw_value_shapes);
    RUN_TEST(test_codec_params_use_wire_names);
    RUN_TEST(test_codec_state_mirror);
    RUN_TEST(test_codec_restore_goes_through_validator);
}

/**
 * Compositor and color tests
 *
 * - ambient base from on/brightness/color temperature
 * - bursts added in queue order with per-channel saturation
 * - exactly one sink call per render
 */

#include <unity.h>
#include "test_support.h"
#include "core/cct.h"
#include "core/compositor.h"

using namespace tron;
using tron::test::CaptureSink;
using tron::test::litState;

static BurstSpec activeSpec(int32_t position, int32_t endpoint, CRGB color, int32_t trail = 1) {
    BurstSpec spec;
    spec.startPosition = position;
    spec.endpoint = endpoint;
    spec.trailLength = trail;
    spec.speedMs = 100;
    spec.color = color;
    return spec;
}

// Admit and activate so the burst renders at its start position
static void addActive(BurstQueue& queue, const BurstSpec& spec, uint16_t len) {
    Burst* burst = queue.admit(spec, len, 0);
    TEST_ASSERT_NOT_NULL(burst);
    burst->step(0);
    TEST_ASSERT_TRUE(burst->isActive());
}

void test_cct_ambient_mid_temperature() {
    ControlState state = litState(0.6f, 320);
    CRGB c = resolveAmbientColor(state.ambient);
    TEST_ASSERT_CRGB_WITHIN_1(77, 77, 0, c);
}

void test_cct_ambient_extremes() {
    ControlState state = litState(0.6f, COLOR_TEMP_COOLEST);
    TEST_ASSERT_CRGB_WITHIN_1(0, 153, 0, resolveAmbientColor(state.ambient));

    state.ambient.colorTemperature = COLOR_TEMP_WARMEST;
    TEST_ASSERT_CRGB_WITHIN_1(153, 0, 0, resolveAmbientColor(state.ambient));
}

void test_cct_ambient_off_is_black() {
    ControlState state = litState(1.0f, 320);
    state.ambient.on = false;
    TEST_ASSERT_CRGB(0, 0, 0, resolveAmbientColor(state.ambient));
}

void test_cct_burst_color_from_levels() {
    AnimationParams anim;
    TEST_ASSERT_CRGB_WITHIN_1(64, 0, 0, burstHeadColor(anim));

    anim.burstWarm = 0;
    anim.burstCool = 200;
    anim.burstBrightness = 0.5f;
    TEST_ASSERT_CRGB_WITHIN_1(0, 100, 0, burstHeadColor(anim));
}

void test_compositor_fills_ambient_and_emits_once() {
    CaptureSink sink;
    Compositor compositor;
    compositor.setSink(&sink);
    compositor.setLedCount(60);

    ControlState state = litState(0.6f, 320);
    BurstQueue queue;
    compositor.render(state.ambient, queue);

    TEST_ASSERT_EQUAL_UINT32(1, sink.showCount);
    TEST_ASSERT_EQUAL_UINT16(60, sink.lastCount);
    TEST_ASSERT_EQUAL_UINT32(1, compositor.getFrameCount());
    for (uint16_t i = 0; i < 60; i++) {
        TEST_ASSERT_CRGB_WITHIN_1(77, 77, 0, sink.frame[i]);
    }
}

void test_compositor_adds_burst_over_ambient() {
    CaptureSink sink;
    Compositor compositor;
    compositor.setSink(&sink);
    compositor.setLedCount(60);

    ControlState state = litState(0.6f, 320);
    BurstQueue queue;
    addActive(queue, activeSpec(10, 20, CRGB(64, 0, 0)), 60);

    compositor.render(state.ambient, queue);

    CRGB base = resolveAmbientColor(state.ambient);
    TEST_ASSERT_UINT8_WITHIN(1, base.r + 64, sink.frame[10].r);
    TEST_ASSERT_EQUAL_UINT8(base.g, sink.frame[10].g);
    TEST_ASSERT_CRGB(base.r, base.g, base.b, sink.frame[9]);
    TEST_ASSERT_CRGB(base.r, base.g, base.b, sink.frame[11]);
}

void test_compositor_overlapping_bursts_saturate() {
    CaptureSink sink;
    Compositor compositor;
    compositor.setSink(&sink);
    compositor.setLedCount(60);

    ControlState state = litState(0.6f, 320);
    BurstQueue queue;
    addActive(queue, activeSpec(5, 30, CRGB(200, 0, 0)), 60);
    addActive(queue, activeSpec(5, 30, CRGB(200, 0, 0)), 60);

    compositor.render(state.ambient, queue);

    TEST_ASSERT_EQUAL_UINT8(255, sink.frame[5].r);
    TEST_ASSERT_UINT8_WITHIN(1, 77, sink.frame[5].g);
}

void test_compositor_ignores_pending_bursts() {
    CaptureSink sink;
    Compositor compositor;
    compositor.setSink(&sink);
    compositor.setLedCount(30);

    ControlState state = litState(0.6f, 320);
    BurstQueue queue;
    BurstSpec spec = activeSpec(3, 20, CRGB(100, 0, 0));
    spec.delayMs = 1000;
    TEST_ASSERT_NOT_NULL(queue.admit(spec, 30, 0));

    compositor.render(state.ambient, queue);

    CRGB base = resolveAmbientColor(state.ambient);
    TEST_ASSERT_CRGB(base.r, base.g, base.b, sink.frame[3]);
}

void test_compositor_led_count_clamped() {
    Compositor compositor;
    compositor.setLedCount(MAX_LED_COUNT + 50);
    TEST_ASSERT_EQUAL_UINT16(MAX_LED_COUNT, compositor.getLedCount());
}

void test_compositor_blank_emits_black() {
    CaptureSink sink;
    Compositor compositor;
    compositor.setSink(&sink);
    compositor.setLedCount(20);

    ControlState state = litState(1.0f, 320);
    BurstQueue queue;
    compositor.render(state.ambient, queue);
    compositor.blank();

    TEST_ASSERT_EQUAL_UINT32(2, sink.showCount);
    for (uint16_t i = 0; i < 20; i++) {
        TEST_ASSERT_CRGB(0, 0, 0, sink.frame[i]);
    }
}

void run_compositor_tests() {
    RUN_TEST(test_cct_ambient_mid_temperature);
    RUN_TEST(test_cct_ambient_extremes);
    RUN_TEST(test_cct_ambient_off_is_black);
    RUN_TEST(test_cct_burst_color_from_levels);
    RUN_TEST(test_compositor_fills_ambient_and_emits_once);
    RUN_TEST(test_compositor_adds_burst_over_ambient);
    RUN_TEST(test_compositor_overlapping_bursts_saturate);
    RUN_TEST(test_compositor_ignores_pending_bursts);
    RUN_TEST(test_compositor_led_count_clamped);
    RUN_TEST(test_compositor_blank_emits_black);
}

/**
 * Burst state machine tests
 *
 * - pending -> active -> finished transitions, one per due step
 * - clamping against the strip at start
 * - one-way and forward-back travel
 * - wraparound-safe deadlines chained from the previous deadline
 * - trail rendering behind the head
 */

#include <unity.h>
#include "test_support.h"
#include "core/burst.h"

using namespace tron;

static BurstSpec makeSpec(int32_t start, int32_t endpoint, int32_t trail, int32_t speed,
                          uint32_t delay = 0, BounceMode bounce = BounceMode::OneWay) {
    BurstSpec spec;
    spec.startPosition = start;
    spec.endpoint = endpoint;
    spec.trailLength = trail;
    spec.speedMs = speed;
    spec.delayMs = delay;
    spec.bounce = bounce;
    spec.color = CRGB(200, 0, 0);
    return spec;
}

// Step whenever due, one ms at a time, until finished or limit; returns advances
static uint32_t runToEnd(Burst& burst, uint32_t now, uint32_t limitMs) {
    for (uint32_t t = now; t < now + limitMs && !burst.isFinished(); t++) {
        if (burst.isDue(t)) burst.step();
    }
    return burst.getStepCount();
}

void test_burst_default_is_finished() {
    Burst burst;
    TEST_ASSERT_TRUE(burst.isFinished());
    TEST_ASSERT_FALSE(burst.isDue(0));
}

void test_burst_start_clamps_to_strip() {
    Burst burst;
    burst.start(makeSpec(-5, 500, 0, 0), 60, 0);
    TEST_ASSERT_EQUAL_UINT16(0, burst.getPosition());
    TEST_ASSERT_EQUAL_UINT16(59, burst.getEndpoint());
    TEST_ASSERT_EQUAL_UINT16(1, burst.getTrailLength());
    TEST_ASSERT_EQUAL_UINT16(1, burst.getSpeed());

    burst.start(makeSpec(0, 10, 1000, 5000), 60, 0);
    TEST_ASSERT_EQUAL_UINT16(60, burst.getTrailLength());
    TEST_ASSERT_EQUAL_UINT16(MAX_SPEED_MS, burst.getSpeed());
}

void test_burst_pending_until_delay_elapses() {
    Burst burst;
    burst.start(makeSpec(0, 10, 3, 20, 500), 60, 1000);

    TEST_ASSERT_TRUE(burst.isPending());
    TEST_ASSERT_EQUAL_UINT32(500, burst.getRemainingDelay(1000));
    TEST_ASSERT_EQUAL_UINT32(200, burst.getRemainingDelay(1300));
    TEST_ASSERT_EQUAL_UINT32(1, burst.getRemainingDelay(1499));
    TEST_ASSERT_EQUAL_UINT32(0, burst.getRemainingDelay(1500));
    TEST_ASSERT_FALSE(burst.isDue(1499));
    TEST_ASSERT_TRUE(burst.isDue(1500));

    burst.step();
    TEST_ASSERT_TRUE(burst.isActive());
    TEST_ASSERT_EQUAL_UINT16(0, burst.getPosition());
    TEST_ASSERT_EQUAL_UINT32(1520, burst.getNextStepAt());
    TEST_ASSERT_EQUAL_UINT32(0, burst.getRemainingDelay(1500));
}

void test_burst_late_steps_keep_cadence() {
    Burst burst;
    burst.start(makeSpec(0, 10, 3, 8, 100), 60, 0);

    // Served 7 ms late: travel is still timed from the 100 ms deadline
    TEST_ASSERT_TRUE(burst.isDue(107));
    burst.step();
    TEST_ASSERT_EQUAL_UINT32(108, burst.getNextStepAt());

    // Ticks every 5 ms against an 8 ms speed: steps land on the first tick
    // at or after each deadline instead of drifting by the lateness
    uint32_t t = 107;
    while (!burst.isFinished() && t < 1000) {
        t += 5;
        if (burst.isDue(t)) burst.step();
    }
    // 10 steps of 8 ms from 100: last deadline at 180, served by the 182 tick
    TEST_ASSERT_EQUAL_UINT32(182, t);
    TEST_ASSERT_EQUAL_UINT32(10, burst.getStepCount());
}

void test_burst_one_way_finishes_after_distance() {
    Burst burst;
    burst.start(makeSpec(0, 10, 3, 10), 60, 0);

    uint32_t steps = runToEnd(burst, 0, 1000);
    TEST_ASSERT_TRUE(burst.isFinished());
    TEST_ASSERT_EQUAL_UINT32(10, steps);
    TEST_ASSERT_EQUAL_UINT16(10, burst.getPosition());
}

void test_burst_one_way_travels_backward() {
    Burst burst;
    burst.start(makeSpec(20, 5, 3, 10), 60, 0);
    TEST_ASSERT_EQUAL_INT8(-1, burst.getDirection());

    uint32_t steps = runToEnd(burst, 0, 1000);
    TEST_ASSERT_TRUE(burst.isFinished());
    TEST_ASSERT_EQUAL_UINT32(15, steps);
    TEST_ASSERT_EQUAL_UINT16(5, burst.getPosition());
}

void test_burst_zero_distance_finishes_on_activation() {
    Burst burst;
    burst.start(makeSpec(7, 7, 3, 10), 60, 0);
    TEST_ASSERT_TRUE(burst.isPending());

    burst.step();
    TEST_ASSERT_TRUE(burst.isFinished());
    TEST_ASSERT_EQUAL_UINT32(0, burst.getStepCount());
}

void test_burst_forward_back_reverses_at_both_ends() {
    Burst burst;
    burst.start(makeSpec(0, 3, 1, 1, 0, BounceMode::ForwardBack), 60, 0);
    burst.step();  // activate

    const uint16_t expected[] = {1, 2, 3, 2, 1, 0, 1, 2, 3, 2};
    uint32_t t = 0;
    for (uint16_t pos : expected) {
        t++;
        TEST_ASSERT_TRUE(burst.isDue(t));
        burst.step();
        TEST_ASSERT_EQUAL_UINT16(pos, burst.getPosition());
    }
}

void test_burst_forward_back_never_finishes() {
    Burst burst;
    burst.start(makeSpec(0, 9, 2, 1, 0, BounceMode::ForwardBack), 60, 0);

    runToEnd(burst, 0, 5000);
    TEST_ASSERT_FALSE(burst.isFinished());
    TEST_ASSERT_TRUE(burst.isActive());
    TEST_ASSERT_TRUE(burst.getStepCount() > 1000);
}

void test_burst_forward_back_endpoint_zero_stays_put() {
    Burst burst;
    burst.start(makeSpec(0, 0, 2, 5, 0, BounceMode::ForwardBack), 60, 0);
    burst.step();

    for (uint32_t t = 5; t <= 100; t += 5) {
        TEST_ASSERT_TRUE(burst.isDue(t));
        burst.step();
        TEST_ASSERT_EQUAL_UINT16(0, burst.getPosition());
    }
    TEST_ASSERT_TRUE(burst.isActive());
}

void test_burst_deadline_survives_clock_wrap() {
    Burst burst;
    uint32_t now = 0xFFFFFFF0u;
    burst.start(makeSpec(0, 10, 3, 10, 0x20), 60, now);

    TEST_ASSERT_EQUAL_UINT32(0x10u, burst.getNextStepAt());
    TEST_ASSERT_FALSE(burst.isDue(0xFFFFFFFFu));
    TEST_ASSERT_FALSE(burst.isDue(0x0Fu));
    TEST_ASSERT_TRUE(burst.isDue(0x10u));
    TEST_ASSERT_TRUE(burst.isDue(0x11u));
}

void test_burst_pending_renders_nothing() {
    CRGB frame[60];
    fill_solid(frame, 60, CRGB::Black);

    Burst burst;
    burst.start(makeSpec(0, 10, 3, 10, 100), 60, 0);
    burst.render(frame, 60);

    for (uint16_t i = 0; i < 60; i++) {
        TEST_ASSERT_CRGB(0, 0, 0, frame[i]);
    }
}

void test_burst_trail_fades_behind_head() {
    Burst burst;
    burst.start(makeSpec(0, 30, 4, 1), 60, 0);
    burst.step();
    for (uint8_t i = 0; i < 5; i++) burst.step();
    TEST_ASSERT_EQUAL_UINT16(5, burst.getPosition());

    CRGB frame[60];
    fill_solid(frame, 60, CRGB::Black);
    burst.render(frame, 60);

    TEST_ASSERT_UINT8_WITHIN(1, 200, frame[5].r);
    TEST_ASSERT_TRUE(frame[4].r < frame[5].r);
    TEST_ASSERT_TRUE(frame[3].r < frame[4].r);
    TEST_ASSERT_TRUE(frame[2].r < frame[3].r);
    TEST_ASSERT_TRUE(frame[2].r > 0);
    TEST_ASSERT_EQUAL_UINT8(0, frame[1].r);
    TEST_ASSERT_EQUAL_UINT8(0, frame[6].r);
}

void test_burst_trail_follows_reverse_direction() {
    Burst burst;
    burst.start(makeSpec(20, 0, 3, 1), 60, 0);
    burst.step();
    burst.step();  // position 19, heading down
    TEST_ASSERT_EQUAL_UINT16(19, burst.getPosition());

    CRGB frame[60];
    fill_solid(frame, 60, CRGB::Black);
    burst.render(frame, 60);

    TEST_ASSERT_UINT8_WITHIN(1, 200, frame[19].r);
    TEST_ASSERT_TRUE(frame[20].r > 0);
    TEST_ASSERT_TRUE(frame[21].r > 0);
    TEST_ASSERT_EQUAL_UINT8(0, frame[18].r);
    TEST_ASSERT_EQUAL_UINT8(0, frame[22].r);
}

void test_burst_trail_clipped_at_strip_start() {
    Burst burst;
    burst.start(makeSpec(0, 30, 5, 1), 60, 0);
    burst.step();
    burst.step();  // head at 1, trail would reach -3

    CRGB frame[60];
    fill_solid(frame, 60, CRGB::Black);
    burst.render(frame, 60);

    TEST_ASSERT_UINT8_WITHIN(1, 200, frame[1].r);
    TEST_ASSERT_TRUE(frame[0].r > 0);
    TEST_ASSERT_EQUAL_UINT8(0, frame[2].r);
}

void run_burst_tests() {
    RUN_TEST(test_burst_default_is_finished);
    RUN_TEST(test_burst_start_clamps_to_strip);
    RUN_TEST(test_burst_pending_until_delay_elapses);
    RUN_TEST(test_burst_late_steps_keep_cadence);
    RUN_TEST(test_burst_one_way_finishes_after_distance);
    RUN_TEST(test_burst_one_way_travels_backward);
    RUN_TEST(test_burst_zero_distance_finishes_on_activation);
    RUN_TEST(test_burst_forward_back_reverses_at_both_ends);
    RUN_TEST(test_burst_forward_back_never_finishes);
    RUN_TEST(test_burst_forward_back_endpoint_zero_stays_put);
    RUN_TEST(test_burst_deadline_survives_clock_wrap);
    RUN_TEST(test_burst_pending_renders_nothing);
    RUN_TEST(test_burst_trail_fades_behind_head);
    RUN_TEST(test_burst_trail_follows_reverse_direction);
    RUN_TEST(test_burst_trail_clipped_at_strip_start);
}

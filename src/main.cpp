/**
 * Motion-triggered LED strip controller for QT Py ESP32-S3
 *
 * Features:
 * - Warm/cool white ambient lighting on a two-channel WS2812B strip
 * - PIR-triggered chase bursts with randomized delay and count
 * - Line-based JSON console on USB serial
 * - Persistent configuration and state (NVS)
 *
 * Hardware:
 * - Adafruit QT Py ESP32-S3 (onboard NeoPixel used as motion indicator)
 * - PIR sensor on GPIO 8
 * - LED strip data on GPIO 18
 */

#include <Arduino.h>
#include <ArduinoJson.h>
#include <esp_task_wdt.h>

#include "main.h"
#include "storage.h"
#include "constants.h"
#include "logging.h"
#include "tron.h"

#include "console/serial_console.h"
#include "hardware/fastled_sink.h"
#include "hardware/indicator.h"
#include "hardware/motion_sensor.h"

// Global configuration
tron::Config config;

tron::TronController controller;
tron::TaskRunner runner;

static tron::FastLedSink strip;
static tron::Indicator indicator;
static tron::MotionSensor motionSensor;
static tron::StatePersister persister(controller, tron::storage);
static tron::SerialConsole console(controller, config, persister);

static int8_t renderTaskId = -1;

void renderTask(void* ctx, uint32_t now) {
    (void)ctx;
    controller.update(now);

    // Full frame rate only while something moves
    runner.setInterval(renderTaskId, controller.getFrameInterval());
}

void motionTask(void* ctx, uint32_t now) {
    (void)ctx;
    bool edge = false;
    bool level = motionSensor.read(edge);

    indicator.setMotion(level);

    // A latched edge with the line already low was a pulse shorter than
    // the poll period; a high level is picked up by onMotionLevel
    bool wasHigh = controller.getMotion().getLevel();
    controller.onMotionLevel(level, now);
    if (edge && !level && !wasHigh) {
        controller.onMotionEdge(now);
    }
}

void consoleTask(void* ctx, uint32_t now) {
    (void)ctx;
    console.poll(now);
}

void stateRefreshTask(void* ctx, uint32_t now) {
    (void)ctx;
    persister.service(now);
}

void setup() {
    Serial.begin(115200);
    delay(1000);
    LOG_INFO(LogTag::MAIN, "=== %s v%s (%s) ===", FIRMWARE_NAME, FIRMWARE_VERSION, FIRMWARE_BUILD_HASH);
    LOG_INFO(LogTag::MAIN, "Initializing...");

    // Initialize storage
    tron::storage.begin();

    // Load configuration
    if (!tron::storage.loadConfig(config)) {
        LOG_WARN(LogTag::STORAGE, "No config found, using defaults");
    } else {
        LOG_INFO(LogTag::STORAGE, "Configuration loaded");
        LOG_DEBUG(LogTag::STORAGE, "LED Count: %d", config.ledCount);
    }

    // Strip and controller
    LOG_INFO(LogTag::LED, "Initializing LED controller...");
    strip.begin();
    controller.begin(config.ledCount, &strip);

    // Persisted state goes through the validator like any other update
    if (!tron::storage.loadState(controller)) {
        LOG_INFO(LogTag::STORAGE, "No saved state, using defaults");
    }

    // Restored state is already in NVS; mirror it before the first change
    persister.setSaveDelay(config.stateSaveDelayMs);
    persister.markClean();
    console.onStateChanged(controller.snapshot());
    controller.addObserver(&persister);
    controller.addObserver(&console);

    // Motion input and indicator
    indicator.begin(config.indicatorEnabled);
    motionSensor.begin();

    console.begin(Serial);

    // Render task first: the runner checks it between every other task
    uint32_t now = millis();
    renderTaskId = runner.addTask("render", renderTask, nullptr, IDLE_FRAME_INTERVAL_MS, now);
    runner.addTask("motion", motionTask, nullptr, MOTION_POLL_INTERVAL_MS, now);
    runner.addTask("console", consoleTask, nullptr, CONSOLE_POLL_INTERVAL_MS, now);
    runner.addTask("state", stateRefreshTask, nullptr, STATE_REFRESH_INTERVAL_MS, now);

    LOG_INFO(LogTag::MAIN, "Setup complete!");
    logMemoryStats(LogTag::MAIN, "at startup");

    // Initialize watchdog timer (older ESP-IDF API)
    esp_task_wdt_init(WATCHDOG_TIMEOUT_SEC, true);  // timeout in seconds, panic on timeout
    esp_task_wdt_add(NULL);  // Add current task (loop)
    LOG_INFO(LogTag::MAIN, "Watchdog initialized (%lus timeout)", static_cast<unsigned long>(WATCHDOG_TIMEOUT_SEC));
}

void loop() {
    runner.runOnce(millis());

    // Reset watchdog - proves loop is still running
    esp_task_wdt_reset();

    // Small delay to prevent watchdog issues
    yield();
}

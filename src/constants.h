#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>
#include <cstddef>

// ============================================
// Project-wide Constants
// ============================================

// --- Pins (QT Py ESP32-S3) ---
#define LED_DATA_PIN 18                 // Strip data pin
#define MOTION_SENSOR_PIN 8             // PIR OUT
#define INDICATOR_DATA_PIN 39           // Onboard NeoPixel data
#define INDICATOR_POWER_PIN 38          // Onboard NeoPixel power enable

// --- LED Configuration ---
constexpr uint16_t MAX_LED_COUNT = 300;
constexpr uint16_t DEFAULT_LED_COUNT = 60;

// --- Power Management ---
constexpr uint8_t LED_VOLTAGE = 5;              // LED strip voltage (5V)
constexpr uint16_t LED_MAX_MILLIAMPS = 2000;    // Max power draw (2A default, adjust for your PSU)

// --- Two-channel (warm/cool) strip wiring ---
// Warm white is wired to the red channel, cool white to the green channel.
constexpr uint16_t COLOR_TEMP_COOLEST = 140;
constexpr uint16_t COLOR_TEMP_WARMEST = 500;

// --- Animation capacity ---
constexpr uint8_t MAX_BURSTS = 16;
constexpr uint16_t MAX_SPEED_MS = 1000;
constexpr uint32_t MAX_DELAY_MS = 60000;

// --- Frame cadence (milliseconds) ---
constexpr uint32_t FRAME_INTERVAL_MS = 1;         // While bursts are live
constexpr uint32_t IDLE_FRAME_INTERVAL_MS = 100;  // Ambient only

// --- Task periods (milliseconds) ---
constexpr uint32_t MOTION_POLL_INTERVAL_MS = 20;
constexpr uint32_t CONSOLE_POLL_INTERVAL_MS = 20;
constexpr uint32_t STATE_REFRESH_INTERVAL_MS = 1000;
constexpr uint32_t STATE_PUBLISH_INTERVAL_MS = 30000;  // Periodic status republish
constexpr uint32_t STATE_SAVE_DELAY_MS = 5000;         // Debounce for NVS writes

// --- Work bounds per task invocation ---
constexpr uint8_t MAX_COMMANDS_PER_FRAME = 8;
constexpr size_t CONSOLE_MAX_BYTES_PER_POLL = 64;
constexpr size_t CONSOLE_LINE_SIZE = 256;

// --- Buffer Sizes ---
constexpr size_t MAX_JSON_STATE_SIZE = 4000;     // NVS limit for state storage

// --- Watchdog ---
constexpr uint32_t WATCHDOG_TIMEOUT_SEC = 30;  // Watchdog timeout in seconds

// --- Version Info ---
#define FIRMWARE_VERSION "1.0.0"
#define FIRMWARE_NAME "TRON"

#ifndef FIRMWARE_BUILD_HASH
#define FIRMWARE_BUILD_HASH "dev"
#endif

#ifndef FIRMWARE_BUILD_TIMESTAMP
#define FIRMWARE_BUILD_TIMESTAMP __DATE__ " " __TIME__
#endif

#endif // CONSTANTS_H

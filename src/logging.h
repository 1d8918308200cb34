#ifndef LOGGING_H
#define LOGGING_H

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#ifdef ARDUINO
#include <Arduino.h>
#endif

// ============================================
// Structured Logging System
// ============================================

// Log levels (can be filtered at compile time)
enum class LogLevel : uint8_t {
    DEBUG = 0,   // Verbose debugging info
    INFO = 1,    // Normal operational messages
    WARN = 2,    // Warning conditions
    ERROR = 3,   // Error conditions
    NONE = 4     // Disable all logging
};

// Set minimum log level (compile-time filter)
#ifndef LOG_LEVEL
#define LOG_LEVEL LogLevel::DEBUG
#endif

// Component tags for filtering/identification
namespace LogTag {
    constexpr const char* MAIN = "MAIN";
    constexpr const char* LED = "LED";
    constexpr const char* MOTION = "PIR";
    constexpr const char* CMD = "CMD";
    constexpr const char* STORAGE = "NVS";
    constexpr const char* TASK = "TASK";
}

// Internal logging implementation
class Logger {
public:
    static void log(LogLevel level, const char* tag, const char* format, ...) {
        if (level < LOG_LEVEL) return;

        va_list args;
        va_start(args, format);
        char buffer[256];
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        const char* marker = "";
        switch (level) {
            case LogLevel::DEBUG: marker = "[D] "; break;
            case LogLevel::INFO:  marker = "[I] "; break;
            case LogLevel::WARN:  marker = "[W] "; break;
            case LogLevel::ERROR: marker = "[E] "; break;
            default: break;
        }

#ifdef ARDUINO
        Serial.printf("[%8lu] %s[%-4s] %s\n", millis(), marker, tag, buffer);
#else
        // Native build (unit tests): no device clock
        printf("%s[%-4s] %s\n", marker, tag, buffer);
#endif
    }
};

// Convenience macros for logging
#define LOG_DEBUG(tag, fmt, ...) Logger::log(LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  Logger::log(LogLevel::INFO, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  Logger::log(LogLevel::WARN, tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) Logger::log(LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#ifdef ARDUINO
// Memory stats helper
inline void logMemoryStats(const char* tag, const char* context = "") {
    LOG_DEBUG(tag, "Heap free: %u, largest block: %u %s",
              ESP.getFreeHeap(), ESP.getMaxAllocHeap(), context);
}
#endif

#endif // LOGGING_H

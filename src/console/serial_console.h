#ifndef TRON_SERIAL_CONSOLE_H
#define TRON_SERIAL_CONSOLE_H

#include <Arduino.h>
#include "json_codec.h"
#include "../constants.h"
#include "../core/control_state.h"

namespace tron {

class TronController;
class StatePersister;
struct Config;

/**
 * SerialConsole - Line-oriented local command ingestion and state mirror
 *
 * Input: one JSON object or bare word per line (see ParsedLine).
 * Output: one JSON object per line, either a state mirror
 * ({"state":"ON",...}) or an error ({"error":"...","key":"..."}).
 *
 * As a StateObserver it only latches the snapshot; the mirror line is
 * written from poll().
 */
class SerialConsole : public StateObserver {
public:
    SerialConsole(TronController& controller, Config& config, StatePersister& persister);

    void begin(Stream& stream);

    // Read at most CONSOLE_MAX_BYTES_PER_POLL bytes, handle any complete
    // lines, then publish a pending or periodic state mirror
    void poll(uint32_t now);

    void onStateChanged(const StateSnapshot& snapshot) override;

private:
    void handleLine(uint32_t now);
    void applyConfig();
    void publishState(uint32_t now);
    void printError(const char* error, const char* key = nullptr);
    void printDoc(const JsonDocument& doc);

    TronController& controller_;
    Config& config_;
    StatePersister& persister_;
    Stream* stream_;

    char line_[CONSOLE_LINE_SIZE];
    size_t lineLen_;
    bool overflow_;         // Discarding until end of line
    ParsedLine parsed_;

    StateSnapshot latest_;
    bool publishPending_;
    uint32_t lastPublishAt_;

    uint32_t lineCount_;    // Reported by "config"
    uint32_t errorCount_;
};

} // namespace tron

#endif // TRON_SERIAL_CONSOLE_H

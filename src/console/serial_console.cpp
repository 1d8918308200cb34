#include "serial_console.h"
#include "../core/controller.h"
#include "../logging.h"
#include "../storage.h"

namespace tron {

SerialConsole::SerialConsole(TronController& controller, Config& config, StatePersister& persister)
    : controller_(controller)
    , config_(config)
    , persister_(persister)
    , stream_(nullptr)
    , lineLen_(0)
    , overflow_(false)
    , latest_(controller.snapshot())
    , publishPending_(true)
    , lastPublishAt_(0)
    , lineCount_(0)
    , errorCount_(0) {
    line_[0] = '\0';
}

void SerialConsole::begin(Stream& stream) {
    stream_ = &stream;
    LOG_INFO(LogTag::CMD, "Console ready (JSON lines or: fire, clear, status, params, config, save)");
}

void SerialConsole::poll(uint32_t now) {
    if (!stream_) return;

    size_t remaining = CONSOLE_MAX_BYTES_PER_POLL;
    while (remaining > 0 && stream_->available() > 0) {
        int c = stream_->read();
        remaining--;
        if (c < 0) break;

        if (c == '\n' || c == '\r') {
            if (overflow_) {
                printError("line too long");
                overflow_ = false;
            } else if (lineLen_ > 0) {
                line_[lineLen_] = '\0';
                handleLine(now);
            }
            lineLen_ = 0;
            continue;
        }

        if (overflow_) continue;
        if (lineLen_ >= CONSOLE_LINE_SIZE - 1) {
            overflow_ = true;
            lineLen_ = 0;
            continue;
        }
        line_[lineLen_++] = static_cast<char>(c);
    }

    if (publishPending_ || now - lastPublishAt_ >= STATE_PUBLISH_INTERVAL_MS) {
        publishState(now);
    }
}

void SerialConsole::onStateChanged(const StateSnapshot& snapshot) {
    latest_ = snapshot;
    publishPending_ = true;
}

void SerialConsole::handleLine(uint32_t now) {
    lineCount_++;

    bool ok = parseLine(line_, parsed_);

    for (uint8_t i = 0; i < parsed_.unknownCount; i++) {
        printError(ok ? "unknown key" : "unrecognised input", parsed_.unknownKeys[i]);
    }
    if (!ok) {
        if (parsed_.unknownCount == 0) printError("invalid JSON");
        return;
    }

    for (uint8_t i = 0; i < parsed_.commandCount; i++) {
        controller_.enqueueCommand(parsed_.commands[i]);
    }

    switch (parsed_.action) {
        case ConsoleAction::Status:
            publishState(now);
            break;
        case ConsoleAction::Params: {
            JsonDocument doc;
            paramsToJson(controller_.getValidator(), doc);
            printDoc(doc);
            break;
        }
        case ConsoleAction::Config: {
            JsonDocument doc;
            storage.configToJson(config_, doc);
            doc["firmware"] = FIRMWARE_NAME " " FIRMWARE_VERSION;
            doc["build"] = FIRMWARE_BUILD_HASH;
            doc["built"] = FIRMWARE_BUILD_TIMESTAMP;
            doc["frames"] = controller_.getScheduler().getTickCount();
            doc["lines"] = lineCount_;
            doc["errors"] = errorCount_;
            doc["unsaved"] = persister_.isDirty();
            printDoc(doc);
            break;
        }
        case ConsoleAction::SetConfig:
            applyConfig();
            break;
        case ConsoleAction::Save:
            if (!persister_.saveNow()) printError("save failed");
            break;
        case ConsoleAction::None:
            break;
    }
}

void SerialConsole::applyConfig() {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, parsed_.configJson);
    if (err) {
        printError("invalid config");
        return;
    }

    uint16_t ledCountWas = config_.ledCount;
    bool indicatorWas = config_.indicatorEnabled;
    storage.configFromJson(config_, doc.as<JsonVariantConst>());

    persister_.setSaveDelay(config_.stateSaveDelayMs);
    if (config_.ledCount != ledCountWas || config_.indicatorEnabled != indicatorWas) {
        LOG_INFO(LogTag::STORAGE, "LED count and indicator changes take effect after restart");
    }

    if (!storage.saveConfig(config_)) {
        printError("config save failed");
        return;
    }

    JsonDocument reply;
    storage.configToJson(config_, reply);
    printDoc(reply);
}

void SerialConsole::publishState(uint32_t now) {
    JsonDocument doc;
    stateToJson(latest_, doc);
    printDoc(doc);
    publishPending_ = false;
    lastPublishAt_ = now;
}

void SerialConsole::printError(const char* error, const char* key) {
    errorCount_++;
    JsonDocument doc;
    doc["error"] = error;
    if (key) doc["key"] = key;
    printDoc(doc);
}

void SerialConsole::printDoc(const JsonDocument& doc) {
    if (!stream_) return;
    serializeJson(doc, *stream_);
    stream_->println();
}

} // namespace tron

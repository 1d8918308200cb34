#include "storage.h"
#include "console/json_codec.h"
#include "core/controller.h"
#include "logging.h"

namespace tron {

const char* Storage::NAMESPACE_CONFIG = "config";
const char* Storage::NAMESPACE_STATE = "state";

Storage storage;

Storage::Storage() {}

bool Storage::begin() {
    return true; // Preferences doesn't need explicit init
}

bool Storage::loadConfig(Config& config) {
    if (!prefs.begin(NAMESPACE_CONFIG, true)) { // read-only
        return false;
    }

    config.ledCount = prefs.getUShort("ledcount", DEFAULT_LED_COUNT);
    config.indicatorEnabled = prefs.getBool("indicator", true);
    config.stateSaveDelayMs = prefs.getULong("save_delay", STATE_SAVE_DELAY_MS);

    prefs.end();

    if (config.ledCount == 0 || config.ledCount > MAX_LED_COUNT) {
        LOG_WARN(LogTag::STORAGE, "Stored LED count %u out of range, using %u",
                 config.ledCount, DEFAULT_LED_COUNT);
        config.ledCount = DEFAULT_LED_COUNT;
    }
    return true;
}

bool Storage::saveConfig(const Config& config) {
    if (!prefs.begin(NAMESPACE_CONFIG, false)) { // read-write
        return false;
    }

    prefs.putUShort("ledcount", config.ledCount);
    prefs.putBool("indicator", config.indicatorEnabled);
    prefs.putULong("save_delay", config.stateSaveDelayMs);

    prefs.end();
    return true;
}

bool Storage::saveState(const TronController& controller) {
    JsonDocument doc;
    paramsToJson(controller.getValidator(), doc);

    String jsonStr;
    serializeJson(doc, jsonStr);

    // NVS has limits, so check size
    if (jsonStr.length() > MAX_JSON_STATE_SIZE) {
        LOG_ERROR(LogTag::STORAGE, "State too large to save (%u bytes)", jsonStr.length());
        return false;
    }

    if (!prefs.begin(NAMESPACE_STATE, false)) {
        return false;
    }
    size_t written = prefs.putString("params", jsonStr);
    prefs.end();

    if (written == 0) {
        LOG_ERROR(LogTag::STORAGE, "Failed to write state");
        return false;
    }
    LOG_DEBUG(LogTag::STORAGE, "State saved (%u bytes)", jsonStr.length());
    return true;
}

bool Storage::loadState(TronController& controller) {
    if (!prefs.begin(NAMESPACE_STATE, true)) {
        return false;
    }
    String jsonStr = prefs.getString("params", "");
    prefs.end();

    if (jsonStr.length() == 0) {
        return false;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, jsonStr);
    if (err || !doc.is<JsonObjectConst>()) {
        LOG_WARN(LogTag::STORAGE, "Stored state unreadable: %s", err.c_str());
        return false;
    }

    uint8_t applied = applyParamsJson(controller, doc.as<JsonObjectConst>());
    LOG_INFO(LogTag::STORAGE, "Restored %u parameters", applied);
    return true;
}

void Storage::configToJson(const Config& config, JsonDocument& doc) {
    doc["ledCount"] = config.ledCount;
    doc["indicatorEnabled"] = config.indicatorEnabled;
    doc["stateSaveDelayMs"] = config.stateSaveDelayMs;
}

bool Storage::configFromJson(Config& config, JsonVariantConst doc) {
    if (doc["ledCount"].is<int>()) {
        config.ledCount = constrain(doc["ledCount"].as<int>(), 1, MAX_LED_COUNT);
    }
    if (doc["indicatorEnabled"].is<bool>()) {
        config.indicatorEnabled = doc["indicatorEnabled"].as<bool>();
    }
    if (doc["stateSaveDelayMs"].is<uint32_t>()) {
        config.stateSaveDelayMs = doc["stateSaveDelayMs"].as<uint32_t>();
    }
    return true;
}

// --- StatePersister ---

StatePersister::StatePersister(const TronController& controller, Storage& store)
    : controller_(controller)
    , store_(store)
    , savedRevision_(controller.getState().revision)
    , pendingRevision_(savedRevision_)
    , changedAt_(0)
    , saveDelayMs_(STATE_SAVE_DELAY_MS)
    , dirty_(false)
    , stampPending_(false) {}

void StatePersister::onStateChanged(const StateSnapshot& snapshot) {
    // Live/idle transitions arrive here too; only parameter writes count
    if (snapshot.revision == pendingRevision_) return;
    pendingRevision_ = snapshot.revision;
    dirty_ = pendingRevision_ != savedRevision_;
    stampPending_ = dirty_;
}

bool StatePersister::service(uint32_t now) {
    if (!dirty_) return false;

    if (stampPending_) {
        changedAt_ = now;
        stampPending_ = false;
        return false;
    }
    if (now - changedAt_ < saveDelayMs_) return false;

    return saveNow();
}

bool StatePersister::saveNow() {
    if (!store_.saveState(controller_)) {
        // Retry after another full delay
        stampPending_ = true;
        return false;
    }
    markClean();
    return true;
}

void StatePersister::markClean() {
    savedRevision_ = controller_.getState().revision;
    pendingRevision_ = savedRevision_;
    dirty_ = false;
    stampPending_ = false;
}

} // namespace tron

#ifndef TRON_STORAGE_H
#define TRON_STORAGE_H

#include <Arduino.h>
#include <Preferences.h>
#include <ArduinoJson.h>
#include "constants.h"
#include "core/control_state.h"

namespace tron {

class TronController;

// Runtime configuration (hardware-facing, not animation state)
struct Config {
    uint16_t ledCount;
    bool indicatorEnabled;        // Onboard NeoPixel mirrors the PIR line
    uint32_t stateSaveDelayMs;    // Quiet time before state is written to NVS

    Config() :
        ledCount(DEFAULT_LED_COUNT),
        indicatorEnabled(true),
        stateSaveDelayMs(STATE_SAVE_DELAY_MS) {}
};

class Storage {
public:
    Storage();

    bool begin();

    // Config operations
    bool loadConfig(Config& config);
    bool saveConfig(const Config& config);

    // Animation/ambient state, stored as the params JSON object
    bool saveState(const TronController& controller);
    // Restores through the validator; returns false if nothing was stored
    bool loadState(TronController& controller);

    void configToJson(const Config& config, JsonDocument& doc);
    // Only fields present in doc are updated
    bool configFromJson(Config& config, JsonVariantConst doc);

private:
    Preferences prefs;
    static const char* NAMESPACE_CONFIG;
    static const char* NAMESPACE_STATE;
};

extern Storage storage;

/**
 * StatePersister - Debounced NVS save of the control state
 *
 * onStateChanged() only notes the revision; service() does the write
 * from the state refresh task once the state has been quiet for
 * stateSaveDelayMs.
 */
class StatePersister : public StateObserver {
public:
    StatePersister(const TronController& controller, Storage& store);

    void onStateChanged(const StateSnapshot& snapshot) override;

    void setSaveDelay(uint32_t delayMs) { saveDelayMs_ = delayMs; }

    // Returns true if a save happened
    bool service(uint32_t now);
    bool saveNow();

    // Treat the current revision as already stored
    void markClean();

    bool isDirty() const { return dirty_; }

private:
    const TronController& controller_;
    Storage& store_;
    uint32_t savedRevision_;
    uint32_t pendingRevision_;
    uint32_t changedAt_;
    uint32_t saveDelayMs_;
    bool dirty_;
    bool stampPending_;     // Change seen; timestamp taken on next service()
};

} // namespace tron

#endif // TRON_STORAGE_H

#ifndef TRON_MOTION_SENSOR_H
#define TRON_MOTION_SENSOR_H

#include <Arduino.h>
#include <atomic>

namespace tron {

/**
 * MotionSensor - PIR input on MOTION_SENSOR_PIN
 *
 * A rising-edge interrupt only latches a flag, so pulses shorter than
 * the poll period are not lost. Everything else happens in read().
 */
class MotionSensor {
public:
    void begin();

    // Current level; edge is set if a rising edge was latched since the
    // previous read
    bool read(bool& edge);

private:
    static void IRAM_ATTR onRisingEdge();
    static std::atomic<bool> edgeLatched_;
};

} // namespace tron

#endif // TRON_MOTION_SENSOR_H

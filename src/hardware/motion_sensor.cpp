#include "motion_sensor.h"
#include "../constants.h"
#include "../logging.h"

namespace tron {

std::atomic<bool> MotionSensor::edgeLatched_(false);

void IRAM_ATTR MotionSensor::onRisingEdge() {
    edgeLatched_.store(true);
}

void MotionSensor::begin() {
    pinMode(MOTION_SENSOR_PIN, INPUT_PULLDOWN);
    edgeLatched_.store(false);
    attachInterrupt(digitalPinToInterrupt(MOTION_SENSOR_PIN), onRisingEdge, RISING);
    LOG_INFO(LogTag::MOTION, "PIR on GPIO %d", MOTION_SENSOR_PIN);
}

bool MotionSensor::read(bool& edge) {
    edge = edgeLatched_.exchange(false);
    return digitalRead(MOTION_SENSOR_PIN) == HIGH;
}

} // namespace tron

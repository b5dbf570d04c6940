#include "ServoBarrier.h"
#include "config.h"
#include "Log.h"

ServoBarrier::ServoBarrier(uint8_t pin, int closedAngle, int openAngle)
    : pin(pin), closedAngle(closedAngle), openAngle(openAngle), opened(false) {
}

bool ServoBarrier::begin() {
    servo.setPeriodHertz(50);
    servo.attach(pin, SERVO_MIN_PULSE_US, SERVO_MAX_PULSE_US);

    if (!servo.attached()) {
        logLine("SERVO", "❌ Failed to attach servo on pin %u", (unsigned)pin);
        return false;
    }

    // Start closed
    servo.write(closedAngle);
    opened = false;
    logLine("SERVO", "Servo attached on pin %u, barrier closed", (unsigned)pin);
    return true;
}

bool ServoBarrier::open() {
    if (opened) {
        return true;
    }
    if (!moveTo(openAngle)) {
        return false;
    }
    opened = true;
    return true;
}

bool ServoBarrier::close() {
    if (!opened) {
        return true;
    }
    if (!moveTo(closedAngle)) {
        return false;
    }
    opened = false;
    return true;
}

bool ServoBarrier::isOpen() const {
    return opened;
}

bool ServoBarrier::moveTo(int angle) {
    if (!servo.attached()) {
        logLine("SERVO", "Servo not attached - cannot move to %d deg", angle);
        return false;
    }
    servo.write(angle);
    return true;
}

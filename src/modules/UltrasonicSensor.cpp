#include "UltrasonicSensor.h"
#include "config.h"

// Speed of sound, cm per microsecond
#define SOUND_SPEED_CM_PER_US 0.0343f

UltrasonicSensor::UltrasonicSensor(uint8_t trigPin, uint8_t echoPin, uint16_t echoTimeoutMs)
    : trigPin(trigPin), echoPin(echoPin), echoTimeoutUs(echoTimeoutMs * 1000UL) {
}

void UltrasonicSensor::begin() {
    pinMode(trigPin, OUTPUT);
    pinMode(echoPin, INPUT);
    digitalWrite(trigPin, LOW);
    delay(50);  // let the module settle
}

float UltrasonicSensor::measureDistance() {
    digitalWrite(trigPin, LOW);
    delayMicroseconds(2);
    digitalWrite(trigPin, HIGH);
    delayMicroseconds(10);
    digitalWrite(trigPin, LOW);

    // Bounded by the timeout both while waiting for the echo and during it
    unsigned long duration = pulseIn(echoPin, HIGH, echoTimeoutUs);
    if (duration == 0) {
        return NO_ECHO_DISTANCE_CM;
    }

    return (duration * SOUND_SPEED_CM_PER_US) / 2.0f;
}

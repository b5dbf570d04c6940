#ifndef ULTRASONICSENSOR_H
#define ULTRASONICSENSOR_H

#include <Arduino.h>
#include "DistanceSource.h"

// HC-SR04 ranging. No echo within the timeout reads as NO_ECHO_DISTANCE_CM.
class UltrasonicSensor : public DistanceSource {
public:
    UltrasonicSensor(uint8_t trigPin, uint8_t echoPin, uint16_t echoTimeoutMs);
    void begin();
    float measureDistance() override;

private:
    uint8_t trigPin;
    uint8_t echoPin;
    uint32_t echoTimeoutUs;
};

#endif

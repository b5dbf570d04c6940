#ifndef SERVOBARRIER_H
#define SERVOBARRIER_H

#include <Arduino.h>
#include <ESP32Servo.h>
#include "BarrierActuator.h"

class ServoBarrier : public BarrierActuator {
public:
    ServoBarrier(uint8_t pin, int closedAngle, int openAngle);
    bool begin();
    bool open() override;
    bool close() override;
    bool isOpen() const;

private:
    Servo servo;
    uint8_t pin;
    int closedAngle;
    int openAngle;
    bool opened;

    bool moveTo(int angle);
};

#endif

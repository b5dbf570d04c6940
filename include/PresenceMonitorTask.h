#ifndef PRESENCEMONITORTASK_H
#define PRESENCEMONITORTASK_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include "ParkingStateMachine.h"
#include "PresenceDetector.h"
#include "config.h"

// Polls one PresenceDetector on its own FreeRTOS task and forwards rising
// edges to the state machine.
class PresenceMonitorTask {
public:
    PresenceMonitorTask(PresenceDetector& detector, ParkingStateMachine& machine,
                        uint16_t pollIntervalMs);
    bool begin(BaseType_t core);

private:
    PresenceDetector& detector;
    ParkingStateMachine& machine;
    uint16_t pollIntervalMs;
    const char* tag;

    TaskHandle_t taskHandle;

    static void monitoringTaskFunction(void* param);
    void monitorLoop();
    void dispatchEdge();
};

#endif

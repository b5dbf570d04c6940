#ifndef FREERTOSTIMERSERVICE_H
#define FREERTOSTIMERSERVICE_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/timers.h>
#include <functional>
#include <map>
#include "TimerService.h"

// One-shot FreeRTOS software timers. Callbacks run on the timer daemon task.
class FreeRtosTimerService : public TimerService {
public:
    FreeRtosTimerService();
    bool begin();

    TimerHandle schedule(uint32_t delayMs, std::function<void()> callback) override;
    void cancel(TimerHandle handle) override;

private:
    struct ScheduledTimer {
        TimerHandle_t timer;
        std::function<void()> callback;
    };

    SemaphoreHandle_t timersMutex;
    std::map<TimerHandle, ScheduledTimer> scheduled;
    TimerHandle nextHandle;

    static void timerCallback(TimerHandle_t timer);
    void fire(TimerHandle_t timer);
};

#endif

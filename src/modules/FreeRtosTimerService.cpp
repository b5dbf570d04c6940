#include "FreeRtosTimerService.h"
#include "Log.h"

#define TAG "TIMER"

FreeRtosTimerService::FreeRtosTimerService()
    : timersMutex(NULL), nextHandle(1) {
}

bool FreeRtosTimerService::begin() {
    if (timersMutex != NULL) {
        return true;
    }

    timersMutex = xSemaphoreCreateMutex();
    if (timersMutex == NULL) {
        logLine(TAG, "❌ Failed to create timer mutex!");
        return false;
    }
    return true;
}

TimerHandle FreeRtosTimerService::schedule(uint32_t delayMs, std::function<void()> callback) {
    if (timersMutex == NULL) {
        logLine(TAG, "Timer service not started");
        return NO_TIMER;
    }

    TickType_t ticks = pdMS_TO_TICKS(delayMs);
    if (ticks == 0) {
        ticks = 1;
    }

    TimerHandle_t timer = xTimerCreate("barrier", ticks, pdFALSE, this, timerCallback);
    if (timer == NULL) {
        logLine(TAG, "❌ xTimerCreate failed");
        return NO_TIMER;
    }

    xSemaphoreTake(timersMutex, portMAX_DELAY);
    TimerHandle handle = nextHandle++;
    if (nextHandle == NO_TIMER) {
        nextHandle = 1;
    }
    ScheduledTimer entry;
    entry.timer = timer;
    entry.callback = callback;
    scheduled[handle] = entry;
    xSemaphoreGive(timersMutex);

    if (xTimerStart(timer, 0) != pdPASS) {
        logLine(TAG, "❌ xTimerStart failed (timer queue full)");
        xSemaphoreTake(timersMutex, portMAX_DELAY);
        scheduled.erase(handle);
        xSemaphoreGive(timersMutex);
        if (xTimerDelete(timer, 0) != pdPASS) {
            logLine(TAG, "⚠️ xTimerDelete failed for unstarted timer");
        }
        return NO_TIMER;
    }

    return handle;
}

void FreeRtosTimerService::cancel(TimerHandle handle) {
    if (handle == NO_TIMER || timersMutex == NULL) {
        return;
    }

    TimerHandle_t timer = NULL;

    xSemaphoreTake(timersMutex, portMAX_DELAY);
    std::map<TimerHandle, ScheduledTimer>::iterator it = scheduled.find(handle);
    if (it != scheduled.end()) {
        timer = it->second.timer;
        scheduled.erase(it);
    }
    xSemaphoreGive(timersMutex);

    // Not found: already fired or firing, and fire() owns the timer.
    // The callback re-checks state itself.
    if (timer != NULL) {
        if (xTimerDelete(timer, 0) != pdPASS) {
            logLine(TAG, "⚠️ xTimerDelete failed for handle %u", (unsigned)handle);
        }
    }
}

void FreeRtosTimerService::timerCallback(TimerHandle_t timer) {
    FreeRtosTimerService* instance = static_cast<FreeRtosTimerService*>(pvTimerGetTimerID(timer));
    instance->fire(timer);
}

void FreeRtosTimerService::fire(TimerHandle_t timer) {
    std::function<void()> callback;
    bool owned = false;

    xSemaphoreTake(timersMutex, portMAX_DELAY);
    for (std::map<TimerHandle, ScheduledTimer>::iterator it = scheduled.begin();
         it != scheduled.end(); ++it) {
        if (it->second.timer == timer) {
            callback = it->second.callback;
            scheduled.erase(it);
            owned = true;
            break;
        }
    }
    xSemaphoreGive(timersMutex);

    // Cancelled concurrently: cancel() already queued the delete
    if (!owned) {
        return;
    }

    if (xTimerDelete(timer, 0) != pdPASS) {
        logLine(TAG, "⚠️ xTimerDelete failed after firing");
    }

    // Run outside the map lock; the callback takes the state machine lock
    if (callback) {
        callback();
    }
}

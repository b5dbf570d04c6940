#include "PresenceMonitorTask.h"
#include "Log.h"

PresenceMonitorTask::PresenceMonitorTask(PresenceDetector& detector, ParkingStateMachine& machine,
                                         uint16_t pollIntervalMs)
    : detector(detector), machine(machine), pollIntervalMs(pollIntervalMs),
      tag(detector.getSide() == SensorSide::Inside ? "SENSOR_IN" : "SENSOR_OUT"),
      taskHandle(NULL) {
}

bool PresenceMonitorTask::begin(BaseType_t core) {
    if (taskHandle != NULL) {
        logLine(tag, "Task already running");
        return true;
    }

    BaseType_t result = xTaskCreatePinnedToCore(
        monitoringTaskFunction,
        detector.getSide() == SensorSide::Inside ? "SensorIn" : "SensorOut",
        SENSOR_TASK_STACK_SIZE,
        this,
        SENSOR_TASK_PRIORITY,
        &taskHandle,
        core
    );

    if (result != pdPASS) {
        logLine(tag, "❌ Failed to create task!");
        taskHandle = NULL;
        return false;
    }

    logLine(tag, "✅ Task created and started on core %d", (int)core);
    return true;
}

void PresenceMonitorTask::monitoringTaskFunction(void* param) {
    PresenceMonitorTask* instance = static_cast<PresenceMonitorTask*>(param);
    logLine(instance->tag, "Monitoring task running...");

    instance->monitorLoop();
}

void PresenceMonitorTask::monitorLoop() {
    vTaskDelay(pdMS_TO_TICKS(SENSOR_TASK_STARTUP_DELAY_MS));

    while (true) {
        if (detector.poll()) {
            dispatchEdge();
        }
        vTaskDelay(pdMS_TO_TICKS(pollIntervalMs));
    }
}

void PresenceMonitorTask::dispatchEdge() {
    bool ok;
    if (detector.getSide() == SensorSide::Inside) {
        ok = machine.notifyInsideEdge();
    } else {
        ok = machine.notifyOutsideEdge();
    }

    if (!ok) {
        logLine(tag, "⚠️ Edge handled with actuator fault");
    }
}

#ifndef MODELS_H
#define MODELS_H

#include <stdint.h>

// ============================================
// Barrier state
// ============================================
enum class BarrierPosition {
    Closed,
    Open
};

// In-progress crossing waiting for the opposite sensor
enum class PendingTransition {
    None,
    EntryPending,
    ExitPending
};

enum class SensorSide {
    Inside,     // parking side
    Outside     // street side
};

enum class TimerSlot {
    Entry,
    Exit,
    ManualClose
};

// ============================================
// Snapshot read under the state machine lock
// ============================================
struct BarrierSnapshot {
    BarrierPosition position;
    uint32_t vehicleCount;
    PendingTransition pending;
    bool actuatorFault;     // last actuator command failed
};

// ============================================
// Manual close outcome (control surface)
// ============================================
enum class ManualCloseResult {
    Closed,
    RejectedVehiclePresent,
    RejectedSequenceInProgress,
    ActuatorFault
};

const char* barrierPositionName(BarrierPosition position);
const char* pendingTransitionName(PendingTransition pending);
const char* sensorSideName(SensorSide side);
const char* timerSlotName(TimerSlot slot);
const char* manualCloseResultName(ManualCloseResult result);

#endif

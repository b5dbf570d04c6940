#include "Models.h"

const char* barrierPositionName(BarrierPosition position) {
    switch (position) {
        case BarrierPosition::Open:
            return "OPEN";
        case BarrierPosition::Closed:
            return "CLOSED";
    }
    return "UNKNOWN";
}

const char* pendingTransitionName(PendingTransition pending) {
    switch (pending) {
        case PendingTransition::None:
            return "NONE";
        case PendingTransition::EntryPending:
            return "ENTRY_PENDING";
        case PendingTransition::ExitPending:
            return "EXIT_PENDING";
    }
    return "UNKNOWN";
}

const char* sensorSideName(SensorSide side) {
    switch (side) {
        case SensorSide::Inside:
            return "INSIDE";
        case SensorSide::Outside:
            return "OUTSIDE";
    }
    return "UNKNOWN";
}

const char* timerSlotName(TimerSlot slot) {
    switch (slot) {
        case TimerSlot::Entry:
            return "ENTRY";
        case TimerSlot::Exit:
            return "EXIT";
        case TimerSlot::ManualClose:
            return "MANUAL";
    }
    return "UNKNOWN";
}

const char* manualCloseResultName(ManualCloseResult result) {
    switch (result) {
        case ManualCloseResult::Closed:
            return "CLOSED";
        case ManualCloseResult::RejectedVehiclePresent:
            return "VEHICLE_PRESENT";
        case ManualCloseResult::RejectedSequenceInProgress:
            return "SEQUENCE_IN_PROGRESS";
        case ManualCloseResult::ActuatorFault:
            return "ACTUATOR_FAULT";
    }
    return "UNKNOWN";
}

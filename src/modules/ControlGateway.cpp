#include "ControlGateway.h"
#include "Log.h"

#define TAG "GATEWAY"

ControlGateway::ControlGateway(ParkingStateMachine& machine, PresenceDetector& inside,
                               PresenceDetector& outside)
    : machine(machine), inside(inside), outside(outside) {
}

bool ControlGateway::requestOpen() {
    logLine(TAG, "Manual open requested");

    bool opened = machine.forceOpen();
    if (!opened) {
        logLine(TAG, "❌ Manual open failed - actuator fault");
    }
    return opened;
}

ManualCloseResult ControlGateway::requestClose() {
    logLine(TAG, "Manual close requested, measuring both sides...");

    // Measured before taking the state machine lock (up to ~300 ms)
    bool insideOccupied = inside.sampleOccupancy();
    bool outsideOccupied = outside.sampleOccupancy();

    ManualCloseResult result = machine.requestForceClose(insideOccupied, outsideOccupied);

    if (result == ManualCloseResult::Closed) {
        logLine(TAG, "Manual close accepted");
    } else {
        logLine(TAG, "Manual close rejected: %s", manualCloseResultName(result));
    }
    return result;
}

BarrierSnapshot ControlGateway::status() const {
    return machine.getSnapshot();
}

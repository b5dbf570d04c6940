#include "ParkingStateMachine.h"
#include "Log.h"

#define TAG "BARRIER"
#define TIMER_TAG "TIMER"

ParkingStateMachine::ParkingStateMachine(BarrierActuator& actuator, TimerService& timers,
                                         const BarrierConfig& config)
    : actuator(actuator), timers(timers),
      pendingTimeoutMs(config.pendingTransitionTimeoutS * 1000UL),
      manualCloseTimeoutMs(config.manualAutoCloseTimeoutS * 1000UL),
      position(BarrierPosition::Closed), pending(PendingTransition::None),
      vehicleCount(0), actuatorFault(false),
      entryTimer(NO_TIMER), exitTimer(NO_TIMER), manualTimer(NO_TIMER) {
}

// ============================================
// Sensor events
// ============================================

bool ParkingStateMachine::notifyOutsideEdge() {
    std::lock_guard<std::recursive_mutex> guard(mutex);
    logLine(TAG, "Rising edge on OUTSIDE sensor");

    switch (pending) {
        case PendingTransition::ExitPending:
            // Vehicle leaving re-triggers the outside sensor: end of exit
            cancelTimer(exitTimer, TimerSlot::Exit);
            return completeExit();
        case PendingTransition::EntryPending:
            logLine(TAG, "Entry already pending - ignored");
            return true;
        case PendingTransition::None:
            break;
    }

    if (position != BarrierPosition::Closed) {
        logLine(TAG, "Barrier held open - ignored");
        return true;
    }

    return startSequence(PendingTransition::EntryPending);
}

bool ParkingStateMachine::notifyInsideEdge() {
    std::lock_guard<std::recursive_mutex> guard(mutex);
    logLine(TAG, "Rising edge on INSIDE sensor");

    switch (pending) {
        case PendingTransition::EntryPending:
            cancelTimer(entryTimer, TimerSlot::Entry);
            return completeEntry();
        case PendingTransition::ExitPending:
            logLine(TAG, "Exit already pending - ignored");
            return true;
        case PendingTransition::None:
            break;
    }

    if (position != BarrierPosition::Closed) {
        logLine(TAG, "Barrier held open - ignored");
        return true;
    }

    if (vehicleCount == 0) {
        logLine(TAG, "No vehicle parked - exit not started");
        return true;
    }

    return startSequence(PendingTransition::ExitPending);
}

bool ParkingStateMachine::startSequence(PendingTransition sequence) {
    bool entry = (sequence == PendingTransition::EntryPending);
    logLine(TAG, "Starting %s sequence", entry ? "ENTRY" : "EXIT");

    cancelTimer(manualTimer, TimerSlot::ManualClose);

    if (!openBarrier()) {
        logLine(TAG, "%s sequence not started", entry ? "ENTRY" : "EXIT");
        return false;
    }

    pending = sequence;

    TimerHandle handle = armTimer(entry ? TimerSlot::Entry : TimerSlot::Exit, pendingTimeoutMs);

    if (handle == NO_TIMER) {
        // Without a timeout the barrier could stay open forever
        logLine(TAG, "Aborting sequence - no timeout available");
        pending = PendingTransition::None;
        bool closed = closeBarrier();
        logState();
        return closed;
    }

    logState();
    return true;
}

// ============================================
// Timer events
// ============================================

void ParkingStateMachine::onEntryTimeout() {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    if (pending != PendingTransition::EntryPending) {
        logLine(TIMER_TAG, "Stale ENTRY timeout ignored (pending=%s)",
                pendingTransitionName(pending));
        return;
    }

    entryTimer = NO_TIMER;
    logLine(TAG, "ENTRY timeout - closing, count unchanged");
    if (!closeBarrier()) {
        logLine(TAG, "Barrier left OPEN after ENTRY timeout");
    }
    pending = PendingTransition::None;
    logState();
}

void ParkingStateMachine::onExitTimeout() {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    if (pending != PendingTransition::ExitPending) {
        logLine(TIMER_TAG, "Stale EXIT timeout ignored (pending=%s)",
                pendingTransitionName(pending));
        return;
    }

    exitTimer = NO_TIMER;
    logLine(TAG, "EXIT timeout - closing, count unchanged");
    if (!closeBarrier()) {
        logLine(TAG, "Barrier left OPEN after EXIT timeout");
    }
    pending = PendingTransition::None;
    logState();
}

void ParkingStateMachine::onManualCloseTimeout() {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    if (position != BarrierPosition::Open || pending != PendingTransition::None) {
        logLine(TIMER_TAG, "Stale MANUAL timeout ignored (barrier=%s, pending=%s)",
                barrierPositionName(position), pendingTransitionName(pending));
        return;
    }

    manualTimer = NO_TIMER;
    logLine(TAG, "Manual open expired - auto close");
    if (!closeBarrier()) {
        logLine(TAG, "Barrier left OPEN after auto close");
    }
    logState();
}

// ============================================
// Sequence completion
// ============================================

bool ParkingStateMachine::completeEntry() {
    bool closed = closeBarrier();
    vehicleCount++;
    pending = PendingTransition::None;
    logLine(TAG, "ENTRY complete -> +1 vehicle");
    logState();
    return closed;
}

bool ParkingStateMachine::completeExit() {
    bool closed = closeBarrier();
    if (vehicleCount > 0) {
        vehicleCount--;
        logLine(TAG, "EXIT complete -> -1 vehicle");
    } else {
        logLine(TAG, "EXIT complete with empty count - not decremented");
    }
    pending = PendingTransition::None;
    logState();
    return closed;
}

// ============================================
// Manual override
// ============================================

bool ParkingStateMachine::canForceClose(bool insideOccupied, bool outsideOccupied) const {
    std::lock_guard<std::recursive_mutex> guard(mutex);
    logLine(TAG, "Force close check: inside=%d outside=%d pending=%s",
            insideOccupied ? 1 : 0, outsideOccupied ? 1 : 0, pendingTransitionName(pending));
    return pending == PendingTransition::None && !insideOccupied && !outsideOccupied;
}

bool ParkingStateMachine::forceClose() {
    std::lock_guard<std::recursive_mutex> guard(mutex);
    logLine(TAG, "Manual request -> close barrier");

    cancelAllTimers();
    bool closed = closeBarrier();
    pending = PendingTransition::None;
    logState();
    return closed;
}

bool ParkingStateMachine::forceOpen() {
    std::lock_guard<std::recursive_mutex> guard(mutex);
    logLine(TAG, "Manual request -> open barrier");

    cancelAllTimers();
    bool opened = openBarrier();
    pending = PendingTransition::None;

    if (opened) {
        armTimer(TimerSlot::ManualClose, manualCloseTimeoutMs);
    }

    logState();
    return opened;
}

ManualCloseResult ParkingStateMachine::requestForceClose(bool insideOccupied, bool outsideOccupied) {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    if (!canForceClose(insideOccupied, outsideOccupied)) {
        if (pending != PendingTransition::None) {
            logLine(TAG, "Manual close refused - sequence in progress");
            return ManualCloseResult::RejectedSequenceInProgress;
        }
        logLine(TAG, "Manual close refused - vehicle present");
        return ManualCloseResult::RejectedVehiclePresent;
    }

    return forceClose() ? ManualCloseResult::Closed : ManualCloseResult::ActuatorFault;
}

// ============================================
// Queries
// ============================================

BarrierSnapshot ParkingStateMachine::getSnapshot() const {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    BarrierSnapshot snapshot;
    snapshot.position = position;
    snapshot.vehicleCount = vehicleCount;
    snapshot.pending = pending;
    snapshot.actuatorFault = actuatorFault;
    return snapshot;
}

bool ParkingStateMachine::isTimerArmed(TimerSlot slot) const {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    switch (slot) {
        case TimerSlot::Entry:
            return entryTimer != NO_TIMER;
        case TimerSlot::Exit:
            return exitTimer != NO_TIMER;
        case TimerSlot::ManualClose:
            return manualTimer != NO_TIMER;
    }
    return false;
}

// ============================================
// Actuator primitives (lock held)
// ============================================

bool ParkingStateMachine::openBarrier() {
    if (position == BarrierPosition::Open) {
        return true;
    }

    if (!actuator.open()) {
        actuatorFault = true;
        logLine(TAG, "⚠️ Actuator fault on OPEN - position stays CLOSED");
        return false;
    }

    actuatorFault = false;
    position = BarrierPosition::Open;
    logLine(TAG, "Barrier opened");
    return true;
}

bool ParkingStateMachine::closeBarrier() {
    if (position == BarrierPosition::Closed) {
        return true;
    }

    if (!actuator.close()) {
        actuatorFault = true;
        logLine(TAG, "⚠️ Actuator fault on CLOSE - position stays OPEN");
        return false;
    }

    actuatorFault = false;
    position = BarrierPosition::Closed;
    logLine(TAG, "Barrier closed");
    return true;
}

// ============================================
// Timer slots (lock held)
// ============================================

TimerHandle ParkingStateMachine::armTimer(TimerSlot slot, uint32_t delayMs) {
    // Written before the lock is released, so the callback always reads it set
    std::shared_ptr<TimerHandle> armed = std::make_shared<TimerHandle>(NO_TIMER);
    TimerHandle handle = timers.schedule(delayMs, [this, slot, armed]() {
        onTimerFired(slot, armed);
    });
    *armed = handle;
    slotHandle(slot) = handle;

    if (handle == NO_TIMER) {
        logLine(TIMER_TAG, "❌ Failed to arm %s timer", timerSlotName(slot));
    } else {
        logLine(TIMER_TAG, "%s timer armed for %u ms", timerSlotName(slot), (unsigned)delayMs);
    }
    return handle;
}

void ParkingStateMachine::onTimerFired(TimerSlot slot, const std::shared_ptr<TimerHandle>& armed) {
    std::lock_guard<std::recursive_mutex> guard(mutex);

    if (*armed == NO_TIMER || *armed != slotHandle(slot)) {
        // Cancelled or replaced by a newer timer of the same kind
        logLine(TIMER_TAG, "Stale %s timer #%u ignored", timerSlotName(slot), (unsigned)*armed);
        return;
    }

    switch (slot) {
        case TimerSlot::Entry:
            onEntryTimeout();
            break;
        case TimerSlot::Exit:
            onExitTimeout();
            break;
        case TimerSlot::ManualClose:
            onManualCloseTimeout();
            break;
    }
}

TimerHandle& ParkingStateMachine::slotHandle(TimerSlot slot) {
    if (slot == TimerSlot::Entry) {
        return entryTimer;
    }
    if (slot == TimerSlot::Exit) {
        return exitTimer;
    }
    return manualTimer;
}

void ParkingStateMachine::cancelTimer(TimerHandle& handle, TimerSlot slot) {
    if (handle == NO_TIMER) {
        return;
    }
    timers.cancel(handle);
    handle = NO_TIMER;
    logLine(TIMER_TAG, "%s timer cancelled", timerSlotName(slot));
}

void ParkingStateMachine::cancelAllTimers() {
    cancelTimer(entryTimer, TimerSlot::Entry);
    cancelTimer(exitTimer, TimerSlot::Exit);
    cancelTimer(manualTimer, TimerSlot::ManualClose);
}

void ParkingStateMachine::logState() const {
    logLine(TAG, "state: barrier=%s count=%u pending=%s%s",
            barrierPositionName(position), (unsigned)vehicleCount,
            pendingTransitionName(pending), actuatorFault ? " FAULT" : "");
}

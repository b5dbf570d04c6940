#ifndef PARKINGSTATEMACHINE_H
#define PARKINGSTATEMACHINE_H

#include <stdint.h>
#include <memory>
#include <mutex>
#include "BarrierActuator.h"
#include "BarrierConfig.h"
#include "Models.h"
#include "TimerService.h"

/*
 * Sequences the barrier from sensor edges, timeouts and manual requests.
 *
 * Owns barrier position, the pending crossing, the vehicle count and the
 * three timer slots (entry, exit, manual auto-close). Every public call takes
 * the same recursive mutex for its whole duration, and the actuator is only
 * ever commanded from inside it.
 *
 * Invariants:
 *   - pending != None implies position == Open
 *   - at most one of the entry/exit timers is armed
 *   - the manual timer is armed only while (Open, None)
 *   - vehicle count never goes below zero
 *
 * Calls that command the actuator return false on an actuator fault. The
 * position is then left at its last confirmed value.
 */
class ParkingStateMachine {
public:
    ParkingStateMachine(BarrierActuator& actuator, TimerService& timers,
                        const BarrierConfig& config);

    // Sensor rising edges
    bool notifyOutsideEdge();
    bool notifyInsideEdge();

    // Timeout handlers. Each re-checks the state that justified it, since a
    // cancelled timer may still fire. Scheduled timers reach them only while
    // their handle is still the one held in the slot.
    void onEntryTimeout();
    void onExitTimeout();
    void onManualCloseTimeout();

    // Manual override. Occupancy must be freshly measured by the caller.
    bool canForceClose(bool insideOccupied, bool outsideOccupied) const;
    bool forceClose();      // no validation of its own
    bool forceOpen();

    // canForceClose + forceClose under a single lock acquisition
    ManualCloseResult requestForceClose(bool insideOccupied, bool outsideOccupied);

    BarrierSnapshot getSnapshot() const;
    bool isTimerArmed(TimerSlot slot) const;

private:
    mutable std::recursive_mutex mutex;

    BarrierActuator& actuator;
    TimerService& timers;
    uint32_t pendingTimeoutMs;
    uint32_t manualCloseTimeoutMs;

    BarrierPosition position;
    PendingTransition pending;
    uint32_t vehicleCount;
    bool actuatorFault;

    TimerHandle entryTimer;
    TimerHandle exitTimer;
    TimerHandle manualTimer;

    bool openBarrier();
    bool closeBarrier();
    bool completeEntry();
    bool completeExit();
    bool startSequence(PendingTransition sequence);

    TimerHandle armTimer(TimerSlot slot, uint32_t delayMs);
    void onTimerFired(TimerSlot slot, const std::shared_ptr<TimerHandle>& armed);
    TimerHandle& slotHandle(TimerSlot slot);
    void cancelTimer(TimerHandle& handle, TimerSlot slot);
    void cancelAllTimers();
    void logState() const;
};

#endif

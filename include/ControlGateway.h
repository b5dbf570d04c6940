#ifndef CONTROLGATEWAY_H
#define CONTROLGATEWAY_H

#include "Models.h"
#include "ParkingStateMachine.h"
#include "PresenceDetector.h"

// Manual open/close and status, as used by the control portal.
// Close requests re-measure both sensors before asking the state machine.
class ControlGateway {
public:
    ControlGateway(ParkingStateMachine& machine, PresenceDetector& inside,
                   PresenceDetector& outside);

    bool requestOpen();
    ManualCloseResult requestClose();
    BarrierSnapshot status() const;

private:
    ParkingStateMachine& machine;
    PresenceDetector& inside;
    PresenceDetector& outside;
};

#endif

#ifndef BARRIERACTUATOR_H
#define BARRIERACTUATOR_H

// Physical barrier drive. Both commands are idempotent against the
// actuator's own cached position and return false on a hardware fault.
class BarrierActuator {
public:
    virtual ~BarrierActuator() {}
    virtual bool open() = 0;
    virtual bool close() = 0;
};

#endif

#ifndef TIMERSERVICE_H
#define TIMERSERVICE_H

#include <stdint.h>
#include <functional>

typedef uint32_t TimerHandle;

static const TimerHandle NO_TIMER = 0;

// One-shot delayed callbacks.
// cancel() is best-effort: a callback already in flight may still run
// after it returns, so callbacks must re-check their own preconditions.
class TimerService {
public:
    virtual ~TimerService() {}

    // Returns NO_TIMER if the timer could not be created
    virtual TimerHandle schedule(uint32_t delayMs, std::function<void()> callback) = 0;

    virtual void cancel(TimerHandle handle) = 0;
};

#endif

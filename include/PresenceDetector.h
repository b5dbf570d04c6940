#ifndef PRESENCEDETECTOR_H
#define PRESENCEDETECTOR_H

#include <stdint.h>
#include <atomic>
#include <mutex>
#include "BarrierConfig.h"
#include "DistanceSource.h"
#include "Models.h"

typedef void (*DelayFunction)(uint32_t ms);

// Debounced occupancy for one sensor side.
// A burst of samples is taken and the side counts as occupied when at least
// a quorum of them are closer than the distance threshold.
class PresenceDetector {
public:
    PresenceDetector(SensorSide side, DistanceSource& source,
                     const BarrierConfig& config, DelayFunction delayFn);

    // Fresh quorum vote. Safe to call from the polling task and the
    // control portal at the same time; bursts are serialized.
    bool sampleOccupancy();

    // One polling step: returns true only on a not-occupied -> occupied edge
    bool poll();

    bool lastOccupancy() const;
    SensorSide getSide() const;

private:
    SensorSide side;
    DistanceSource& source;
    float thresholdCm;
    uint8_t sampleCount;
    uint8_t quorum;
    uint16_t interSampleDelayMs;
    DelayFunction delayFn;

    std::mutex sampleMutex;
    std::atomic<bool> previousOccupied;
};

#endif

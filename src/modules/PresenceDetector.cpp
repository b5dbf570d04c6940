#include "PresenceDetector.h"
#include "Log.h"

static const char* sideTag(SensorSide side) {
    return side == SensorSide::Inside ? "SENSOR_IN" : "SENSOR_OUT";
}

PresenceDetector::PresenceDetector(SensorSide side, DistanceSource& source,
                                   const BarrierConfig& config, DelayFunction delayFn)
    : side(side), source(source), thresholdCm(config.distanceThresholdCm),
      sampleCount(config.debounceSampleCount), quorum(config.debounceQuorum),
      interSampleDelayMs(config.interSampleDelayMs), delayFn(delayFn),
      previousOccupied(false) {
}

bool PresenceDetector::sampleOccupancy() {
    std::lock_guard<std::mutex> guard(sampleMutex);

    uint8_t nearCount = 0;
    for (uint8_t i = 0; i < sampleCount; i++) {
        float distance = source.measureDistance();
        if (distance < thresholdCm) {
            nearCount++;
        }
        if (delayFn != nullptr && interSampleDelayMs > 0) {
            delayFn(interSampleDelayMs);
        }
    }

    return nearCount >= quorum;
}

bool PresenceDetector::poll() {
    bool occupied = sampleOccupancy();
    bool wasOccupied = previousOccupied.exchange(occupied);

    if (occupied != wasOccupied) {
        logLine(sideTag(side), "Occupancy %s", occupied ? "DETECTED" : "CLEARED");
    }

    return occupied && !wasOccupied;
}

bool PresenceDetector::lastOccupancy() const {
    return previousOccupied.load();
}

SensorSide PresenceDetector::getSide() const {
    return side;
}

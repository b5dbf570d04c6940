#ifndef BARRIERCONFIG_H
#define BARRIERCONFIG_H

#include <stdint.h>

// Runtime tunables, persisted by ConfigManager
struct BarrierConfig {
    float distanceThresholdCm;
    uint8_t debounceSampleCount;
    uint8_t debounceQuorum;
    uint16_t interSampleDelayMs;
    uint16_t sensorPollIntervalMs;
    uint16_t pendingTransitionTimeoutS;
    uint16_t manualAutoCloseTimeoutS;
    uint16_t echoTimeoutMs;
};

// Fill with the compile-time defaults from config.h
void getBarrierDefaults(BarrierConfig& config);

// Range checks; logs the first offending field
bool validateBarrierConfig(const BarrierConfig& config);

// Stores an integer tunable by its settings key ("samples", "quorum",
// "sample_ms", "poll_ms", "echo_ms", "pending_s", "manual_s").
// Returns false, leaving the field untouched, for an unknown key or a value
// the field cannot hold. Full range checks are still validateBarrierConfig's.
bool setBarrierSetting(BarrierConfig& config, const char* key, long value);

#endif

#include "BarrierConfig.h"
#include <string.h>
#include "config.h"
#include "Log.h"

#define MAX_DEBOUNCE_SAMPLES 10

void getBarrierDefaults(BarrierConfig& config) {
    config.distanceThresholdCm = DISTANCE_THRESHOLD_CM;
    config.debounceSampleCount = DEBOUNCE_SAMPLE_COUNT;
    config.debounceQuorum = DEBOUNCE_QUORUM;
    config.interSampleDelayMs = INTER_SAMPLE_DELAY_MS;
    config.sensorPollIntervalMs = SENSOR_POLL_INTERVAL_MS;
    config.pendingTransitionTimeoutS = PENDING_TRANSITION_TIMEOUT_S;
    config.manualAutoCloseTimeoutS = MANUAL_AUTO_CLOSE_TIMEOUT_S;
    config.echoTimeoutMs = ECHO_TIMEOUT_MS;
}

bool validateBarrierConfig(const BarrierConfig& config) {
    if (!(config.distanceThresholdCm > 0.0f)) {
        logLine("ConfigManager", "Validation failed: distance threshold must be positive");
        return false;
    }

    if (config.debounceSampleCount == 0 || config.debounceSampleCount > MAX_DEBOUNCE_SAMPLES) {
        logLine("ConfigManager", "Validation failed: sample count %u out of range 1..%d",
                (unsigned)config.debounceSampleCount, MAX_DEBOUNCE_SAMPLES);
        return false;
    }

    if (config.debounceQuorum == 0 || config.debounceQuorum > config.debounceSampleCount) {
        logLine("ConfigManager", "Validation failed: quorum %u must be within 1..%u",
                (unsigned)config.debounceQuorum, (unsigned)config.debounceSampleCount);
        return false;
    }

    if (config.interSampleDelayMs > 1000) {
        logLine("ConfigManager", "Validation failed: inter-sample delay above 1000 ms");
        return false;
    }

    if (config.sensorPollIntervalMs == 0 || config.sensorPollIntervalMs > 1000) {
        logLine("ConfigManager", "Validation failed: poll interval out of range 1..1000 ms");
        return false;
    }

    if (config.pendingTransitionTimeoutS == 0 || config.pendingTransitionTimeoutS > 60) {
        logLine("ConfigManager", "Validation failed: pending timeout out of range 1..60 s");
        return false;
    }

    if (config.manualAutoCloseTimeoutS == 0 || config.manualAutoCloseTimeoutS > 600) {
        logLine("ConfigManager", "Validation failed: manual auto-close out of range 1..600 s");
        return false;
    }

    if (config.echoTimeoutMs == 0 || config.echoTimeoutMs > 100) {
        logLine("ConfigManager", "Validation failed: echo timeout out of range 1..100 ms");
        return false;
    }

    return true;
}

static bool fitsField(const char* key, long value, long maxValue) {
    if (value < 0 || value > maxValue) {
        logLine("ConfigManager", "Rejected %s=%ld (field holds 0..%ld)", key, value, maxValue);
        return false;
    }
    return true;
}

bool setBarrierSetting(BarrierConfig& config, const char* key, long value) {
    if (strcmp(key, "samples") == 0) {
        if (!fitsField(key, value, UINT8_MAX)) return false;
        config.debounceSampleCount = (uint8_t)value;
    } else if (strcmp(key, "quorum") == 0) {
        if (!fitsField(key, value, UINT8_MAX)) return false;
        config.debounceQuorum = (uint8_t)value;
    } else if (strcmp(key, "sample_ms") == 0) {
        if (!fitsField(key, value, UINT16_MAX)) return false;
        config.interSampleDelayMs = (uint16_t)value;
    } else if (strcmp(key, "poll_ms") == 0) {
        if (!fitsField(key, value, UINT16_MAX)) return false;
        config.sensorPollIntervalMs = (uint16_t)value;
    } else if (strcmp(key, "echo_ms") == 0) {
        if (!fitsField(key, value, UINT16_MAX)) return false;
        config.echoTimeoutMs = (uint16_t)value;
    } else if (strcmp(key, "pending_s") == 0) {
        if (!fitsField(key, value, UINT16_MAX)) return false;
        config.pendingTransitionTimeoutS = (uint16_t)value;
    } else if (strcmp(key, "manual_s") == 0) {
        if (!fitsField(key, value, UINT16_MAX)) return false;
        config.manualAutoCloseTimeoutS = (uint16_t)value;
    } else {
        logLine("ConfigManager", "Unknown setting '%s'", key);
        return false;
    }
    return true;
}

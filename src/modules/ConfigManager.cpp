#include "ConfigManager.h"
#include "config.h"
#include "Log.h"
#include <string.h>
#include <nvs_flash.h>

#define TAG "ConfigManager"

const char* ConfigManager::PREF_NAMESPACE = "barrier_cfg";
const uint32_t ConfigManager::CONFIG_VERSION = 1;

ConfigManager::ConfigManager() {
}

bool ConfigManager::begin() {
    // Initialize NVS (Non-Volatile Storage) - required for Preferences
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        // NVS partition was truncated and needs to be erased
        logLine(TAG, "NVS partition needs erase, erasing...");
        err = nvs_flash_erase();
        if (err == ESP_OK) {
            err = nvs_flash_init();
        }
    }

    if (err != ESP_OK) {
        logLine(TAG, "❌ NVS init failed: %s", esp_err_to_name(err));
        return false;
    }

    logLine(TAG, "NVS initialized");
    return true;
}

bool ConfigManager::load(DeviceConfiguration& config) {
    getDefaults(config);

    if (!preferences.begin(PREF_NAMESPACE, true)) { // Read-only mode
        logLine(TAG, "No configuration found, using defaults");
        return false;
    }

    bool configured = preferences.getBool("configured", false);
    if (!configured) {
        logLine(TAG, "Device not configured yet, using defaults");
        preferences.end();
        return false;
    }

    preferences.getString("wifi_ssid", config.wifi_ssid, sizeof(config.wifi_ssid));
    preferences.getString("wifi_pass", config.wifi_password, sizeof(config.wifi_password));
    preferences.getString("hostname", config.hostname, sizeof(config.hostname));

    BarrierConfig& barrier = config.barrier;
    barrier.distanceThresholdCm = preferences.getFloat("dist_cm", barrier.distanceThresholdCm);
    barrier.debounceSampleCount = preferences.getUChar("samples", barrier.debounceSampleCount);
    barrier.debounceQuorum = preferences.getUChar("quorum", barrier.debounceQuorum);
    barrier.interSampleDelayMs = preferences.getUShort("sample_ms", barrier.interSampleDelayMs);
    barrier.sensorPollIntervalMs = preferences.getUShort("poll_ms", barrier.sensorPollIntervalMs);
    barrier.pendingTransitionTimeoutS = preferences.getUShort("pending_s", barrier.pendingTransitionTimeoutS);
    barrier.manualAutoCloseTimeoutS = preferences.getUShort("manual_s", barrier.manualAutoCloseTimeoutS);
    barrier.echoTimeoutMs = preferences.getUShort("echo_ms", barrier.echoTimeoutMs);

    config.configured = configured;
    config.config_version = preferences.getUInt("version", CONFIG_VERSION);

    preferences.end();

    // Bad tunables are dropped as a whole, WiFi settings are kept
    if (!validateBarrierConfig(config.barrier)) {
        logLine(TAG, "⚠️ Stored barrier settings invalid, using defaults");
        getBarrierDefaults(config.barrier);
    }

    logLine(TAG, "Configuration loaded successfully");
    return true;
}

bool ConfigManager::save(const DeviceConfiguration& config) {
    if (!validate(config)) {
        logLine(TAG, "Configuration validation failed");
        return false;
    }

    if (!preferences.begin(PREF_NAMESPACE, false)) { // Read-write mode
        logLine(TAG, "Failed to open preferences for writing");
        return false;
    }

    preferences.putString("wifi_ssid", config.wifi_ssid);
    preferences.putString("wifi_pass", config.wifi_password);
    preferences.putString("hostname", config.hostname);

    const BarrierConfig& barrier = config.barrier;
    preferences.putFloat("dist_cm", barrier.distanceThresholdCm);
    preferences.putUChar("samples", barrier.debounceSampleCount);
    preferences.putUChar("quorum", barrier.debounceQuorum);
    preferences.putUShort("sample_ms", barrier.interSampleDelayMs);
    preferences.putUShort("poll_ms", barrier.sensorPollIntervalMs);
    preferences.putUShort("pending_s", barrier.pendingTransitionTimeoutS);
    preferences.putUShort("manual_s", barrier.manualAutoCloseTimeoutS);
    preferences.putUShort("echo_ms", barrier.echoTimeoutMs);

    // Written last so a partial save still reads as unconfigured
    bool saved = preferences.putUInt("version", CONFIG_VERSION) > 0 &&
                 preferences.putBool("configured", true) > 0;

    preferences.end();

    if (!saved) {
        logLine(TAG, "❌ Failed to write configuration");
        return false;
    }

    logLine(TAG, "Configuration saved successfully");
    return true;
}

bool ConfigManager::isConfigured() {
    if (!preferences.begin(PREF_NAMESPACE, true)) {
        return false;
    }

    bool configured = preferences.getBool("configured", false);
    preferences.end();

    return configured;
}

bool ConfigManager::factoryReset() {
    logLine(TAG, "Performing factory reset...");

    if (!preferences.begin(PREF_NAMESPACE, false)) {
        logLine(TAG, "Failed to open preferences for reset");
        return false;
    }

    bool cleared = preferences.clear();
    preferences.end();

    logLine(TAG, cleared ? "Factory reset complete" : "❌ Factory reset failed");
    return cleared;
}

void ConfigManager::getDefaults(DeviceConfiguration& config) {
    memset(&config, 0, sizeof(config));

    // WiFi defaults (from config.h)
    strncpy(config.wifi_ssid, WIFI_SSID, sizeof(config.wifi_ssid) - 1);
    strncpy(config.wifi_password, WIFI_PASSWORD, sizeof(config.wifi_password) - 1);
    strncpy(config.hostname, DEVICE_HOSTNAME, sizeof(config.hostname) - 1);

    getBarrierDefaults(config.barrier);

    config.configured = false;
    config.config_version = CONFIG_VERSION;
}

bool ConfigManager::validate(const DeviceConfiguration& config) {
    if (strlen(config.wifi_ssid) == 0) {
        logLine(TAG, "Validation failed: WiFi SSID is empty");
        return false;
    }

    if (strlen(config.hostname) == 0) {
        logLine(TAG, "Validation failed: hostname is empty");
        return false;
    }

    return validateBarrierConfig(config.barrier);
}

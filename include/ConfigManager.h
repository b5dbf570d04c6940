#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <Arduino.h>
#include <Preferences.h>
#include "BarrierConfig.h"

// Cấu hình lưu trong NVS
struct DeviceConfiguration {
    // WiFi Settings
    char wifi_ssid[32];
    char wifi_password[64];
    char hostname[32];

    // Barrier tunables
    BarrierConfig barrier;

    // Metadata
    bool configured;
    uint32_t config_version;
};

class ConfigManager {
public:
    ConfigManager();

    // Khởi tạo NVS
    bool begin();

    // Tải cấu hình từ NVS (false = đang dùng mặc định)
    bool load(DeviceConfiguration& config);

    // Lưu cấu hình vào NVS
    bool save(const DeviceConfiguration& config);

    bool isConfigured();

    // Xóa tất cả cấu hình
    bool factoryReset();

    void getDefaults(DeviceConfiguration& config);

    bool validate(const DeviceConfiguration& config);

private:
    Preferences preferences;

    static const char* PREF_NAMESPACE;
    static const uint32_t CONFIG_VERSION;
};

#endif

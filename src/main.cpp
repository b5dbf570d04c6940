/******************************************************
 * Parking barrier controller - ESP32
 *
 * - Two HC-SR04 sensors (inside / outside) with quorum debounce
 * - Servo barrier sequenced by ParkingStateMachine
 * - Entry/exit crossing timeouts, auto close after manual open
 * - Web control portal: status, manual open/close, settings
 * - LCD shows barrier state and vehicle count
 *
 * See config.h for pins and default timings
 ******************************************************/

#include <Arduino.h>
#include <WiFi.h>
#include <time.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "config.h"
#include "Log.h"
#include "Models.h"
#include "BarrierConfig.h"
#include "ConfigManager.h"
#include "WiFiManager.h"
#include "LCDDisplay.h"
#include "UltrasonicSensor.h"
#include "ServoBarrier.h"
#include "FreeRtosTimerService.h"
#include "PresenceDetector.h"
#include "ParkingStateMachine.h"
#include "PresenceMonitorTask.h"
#include "ControlGateway.h"
#include "ControlPortal.h"

ConfigManager configManager;
DeviceConfiguration deviceConfig;

WiFiManager wifiManager(WIFI_SSID, WIFI_PASSWORD);
LCDDisplay lcdDisplay(LCD_I2C_ADDR, LCD_COLS, LCD_ROWS);
ServoBarrier servoBarrier(PIN_BARRIER_SERVO, SERVO_CLOSED_ANGLE, SERVO_OPEN_ANGLE);
FreeRtosTimerService timerService;

// Built in setup() once the stored tunables are known
ParkingStateMachine* stateMachine = NULL;

static void serialLogSink(const char* tag, const char* message) {
    Serial.printf("[%s] %s\n", tag, message);
}

static void taskDelay(uint32_t ms) {
    vTaskDelay(pdMS_TO_TICKS(ms));
}

void setup() {
    Serial.begin(115200);
    setLogSink(serialLogSink);

    Serial.println("\n\n==========================================");
    Serial.println("Parking Barrier Controller");
    Serial.println("Firmware: " FIRMWARE_VERSION);
    Serial.println("==========================================\n");

    lcdDisplay.begin(PIN_LCD_SDA, PIN_LCD_SCL);
    lcdDisplay.show("Starting...", "Please wait");

    logLine("INIT", "Loading configuration...");
    if (!configManager.begin()) {
        logLine("INIT", "NVS unavailable - running on defaults");
    } else if (!configManager.isConfigured()) {
        logLine("INIT", "First boot - no stored settings");
    }
    if (!configManager.load(deviceConfig)) {
        logLine("INIT", "Using default configuration");
    }

    const BarrierConfig& barrierConfig = deviceConfig.barrier;
    logLine("INIT", "threshold=%.1fcm samples=%u quorum=%u pending=%us manual=%us",
            barrierConfig.distanceThresholdCm,
            (unsigned)barrierConfig.debounceSampleCount, (unsigned)barrierConfig.debounceQuorum,
            (unsigned)barrierConfig.pendingTransitionTimeoutS,
            (unsigned)barrierConfig.manualAutoCloseTimeoutS);

    logLine("INIT", "Initializing hardware...");

    static UltrasonicSensor insideSensor(PIN_SENSOR_IN_TRIG, PIN_SENSOR_IN_ECHO,
                                         barrierConfig.echoTimeoutMs);
    static UltrasonicSensor outsideSensor(PIN_SENSOR_OUT_TRIG, PIN_SENSOR_OUT_ECHO,
                                          barrierConfig.echoTimeoutMs);
    insideSensor.begin();
    outsideSensor.begin();

    if (!servoBarrier.begin()) {
        // Commands will report actuator faults until the servo is fixed
        logLine("INIT", "⚠️ Servo not available");
        lcdDisplay.show("Servo error", "Check wiring");
        delay(2000);
    }

    if (!timerService.begin()) {
        logLine("INIT", "⚠️ Timer service unavailable - crossings will be refused");
    }

    static PresenceDetector insideDetector(SensorSide::Inside, insideSensor,
                                           barrierConfig, taskDelay);
    static PresenceDetector outsideDetector(SensorSide::Outside, outsideSensor,
                                            barrierConfig, taskDelay);

    static ParkingStateMachine machine(servoBarrier, timerService, barrierConfig);
    stateMachine = &machine;

    static ControlGateway gateway(machine, insideDetector, outsideDetector);
    static ControlPortal controlPortal(gateway, configManager);

    logLine("INIT", "Hardware OK");

    // Network: station first, local access point as fallback
    wifiManager.setCredentials(deviceConfig.wifi_ssid, deviceConfig.wifi_password);
    wifiManager.begin(deviceConfig.hostname);
    lcdDisplay.show("Connecting...", deviceConfig.wifi_ssid);

    if (wifiManager.connect()) {
        configTime(0, 0, "pool.ntp.org", "time.nist.gov");
    } else {
        logLine("INIT", "WiFi failed -> starting fallback access point");
        if (wifiManager.startAccessPoint()) {
            lcdDisplay.show("AP mode", wifiManager.getAccessPointSSID());
            delay(2000);
        }
    }

    controlPortal.begin();
    logLine("INIT", "Portal at http://%s/", wifiManager.getAddress().c_str());

    // One polling task per side, on separate cores
    static PresenceMonitorTask insideTask(insideDetector, machine, barrierConfig.sensorPollIntervalMs);
    static PresenceMonitorTask outsideTask(outsideDetector, machine, barrierConfig.sensorPollIntervalMs);

    bool tasksStarted = insideTask.begin(0);
    tasksStarted = outsideTask.begin(1) && tasksStarted;
    if (!tasksStarted) {
        logLine("INIT", "❌ Sensor task start failed");
        lcdDisplay.show("Sensor task", "start failed");
        delay(2000);
    }

    lcdDisplay.showStatus(machine.getSnapshot());
    logLine("INIT", "System ready!");
}

void loop() {
    static unsigned long lastDisplayRefresh = 0;
    unsigned long now = millis();

    if (!wifiManager.isAccessPointActive() && !wifiManager.isConnected()) {
        wifiManager.reconnect();
    }

    if (stateMachine != NULL && now - lastDisplayRefresh >= DISPLAY_REFRESH_INTERVAL_MS) {
        lastDisplayRefresh = now;
        lcdDisplay.showStatus(stateMachine->getSnapshot());
    }

    delay(10);
}

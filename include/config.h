#ifndef CONFIG_H
#define CONFIG_H

// ============================================
// WiFi Configuration (defaults, overridable from the portal)
// ============================================
#define WIFI_SSID "parking-gate"
#define WIFI_PASSWORD "change-this-password"
#define WIFI_CONNECT_TIMEOUT_MS 10000
#define WIFI_RECONNECT_INTERVAL_MS 30000

#define DEVICE_HOSTNAME "barrier-lane-01"
#define FIRMWARE_VERSION "1.0.0"

// Fallback access point when the station connection fails
#define FALLBACK_AP_PASSWORD "88888888"
#define FALLBACK_AP_CHANNEL 1

// ============================================
// Hardware Pin Configuration (ESP32-WROOM-32)
// ============================================
// Avoid flash pins 6-11, strapping pins 0/2/5/12/15 and the
// input-only 34-39 for anything driven as an output.
// Echo lines are 5V on the HC-SR04: use a divider to 3.3V.

// HC-SR04 inside sensor (parking side)
#define PIN_SENSOR_IN_TRIG 26
#define PIN_SENSOR_IN_ECHO 27

// HC-SR04 outside sensor (street side)
#define PIN_SENSOR_OUT_TRIG 19
#define PIN_SENSOR_OUT_ECHO 18

// Barrier servo
#define PIN_BARRIER_SERVO 25
#define SERVO_CLOSED_ANGLE 0
#define SERVO_OPEN_ANGLE 90
#define SERVO_MIN_PULSE_US 500
#define SERVO_MAX_PULSE_US 2400

// LCD I2C
#define PIN_LCD_SDA 32
#define PIN_LCD_SCL 33
#define LCD_I2C_ADDR 0x27  // or 0x3F, depends on your module
#define LCD_COLS 16
#define LCD_ROWS 2

// ============================================
// Presence Detection Defaults
// ============================================
#define DISTANCE_THRESHOLD_CM 10
#define DEBOUNCE_SAMPLE_COUNT 3
#define DEBOUNCE_QUORUM 2
#define INTER_SAMPLE_DELAY_MS 50
#define SENSOR_POLL_INTERVAL_MS 50
#define ECHO_TIMEOUT_MS 20

// Reported when no echo comes back before the timeout
#define NO_ECHO_DISTANCE_CM 999.0f

// ============================================
// Barrier Sequencing Defaults
// ============================================
#define PENDING_TRANSITION_TIMEOUT_S 3
#define MANUAL_AUTO_CLOSE_TIMEOUT_S 5

// ============================================
// FreeRTOS Tasks
// ============================================
#define SENSOR_TASK_STACK_SIZE 4096
#define SENSOR_TASK_PRIORITY 1
#define SENSOR_TASK_STARTUP_DELAY_MS 500

// ============================================
// Control Portal
// ============================================
#define WEB_PORT 80
#define DISPLAY_REFRESH_INTERVAL_MS 250

#endif // CONFIG_H

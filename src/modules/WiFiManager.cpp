#include "WiFiManager.h"
#include "config.h"
#include "Log.h"

#define TAG "WiFi"

WiFiManager::WiFiManager(const char* ssid, const char* password)
    : ssid(ssid), password(password), apActive(false), lastReconnectAttempt(0) {
}

void WiFiManager::begin(const char* hostname) {
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(hostname);
}

bool WiFiManager::connect() {
    logLine(TAG, "Connecting to %s", ssid.c_str());

    WiFi.begin(ssid.c_str(), password.c_str());

    uint32_t startTime = millis();
    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - startTime > WIFI_CONNECT_TIMEOUT_MS) {
            logLine(TAG, "Connection timeout");
            return false;
        }
        delay(500);
    }

    logLine(TAG, "Connected! IP: %s", WiFi.localIP().toString().c_str());
    return true;
}

bool WiFiManager::isConnected() {
    return WiFi.status() == WL_CONNECTED;
}

void WiFiManager::reconnect() {
    // Station retries are pointless while serving the fallback AP
    if (apActive) {
        return;
    }

    uint32_t now = millis();

    // Throttle reconnect attempts
    if (now - lastReconnectAttempt < WIFI_RECONNECT_INTERVAL_MS) {
        return;
    }

    lastReconnectAttempt = now;

    if (!isConnected()) {
        logLine(TAG, "Reconnecting...");
        WiFi.disconnect();
        WiFi.reconnect();
    }
}

bool WiFiManager::startAccessPoint() {
    if (apActive) {
        return true;
    }

    uint8_t mac[6];
    WiFi.macAddress(mac);
    char macStr[7];
    snprintf(macStr, sizeof(macStr), "%02X%02X%02X", mac[3], mac[4], mac[5]);
    apSSID = "Barrier-" + String(macStr);

    WiFi.mode(WIFI_AP_STA);
    if (!WiFi.softAP(apSSID.c_str(), FALLBACK_AP_PASSWORD, FALLBACK_AP_CHANNEL)) {
        logLine(TAG, "❌ Failed to start access point %s", apSSID.c_str());
        return false;
    }

    apActive = true;
    logLine(TAG, "Access point %s up, IP: %s", apSSID.c_str(),
            WiFi.softAPIP().toString().c_str());
    return true;
}

bool WiFiManager::isAccessPointActive() const {
    return apActive;
}

String WiFiManager::getAccessPointSSID() const {
    return apSSID;
}

void WiFiManager::setCredentials(const char* newSSID, const char* newPassword) {
    ssid = newSSID;
    password = newPassword;
    logLine(TAG, "Credentials updated");
}

String WiFiManager::getAddress() {
    if (isConnected()) {
        return WiFi.localIP().toString();
    }
    if (apActive) {
        return WiFi.softAPIP().toString();
    }
    return String("0.0.0.0");
}

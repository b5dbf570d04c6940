#ifndef WIFI_MANAGER_H
#define WIFI_MANAGER_H

#include <Arduino.h>
#include <WiFi.h>

class WiFiManager {
public:
    WiFiManager(const char* ssid, const char* password);

    void begin(const char* hostname);
    bool connect();
    bool isConnected();
    void reconnect();

    // Local AP so the control portal stays reachable without a router
    bool startAccessPoint();
    bool isAccessPointActive() const;
    String getAccessPointSSID() const;

    void setCredentials(const char* newSSID, const char* newPassword);
    String getAddress();

private:
    String ssid;
    String password;
    String apSSID;
    bool apActive;
    uint32_t lastReconnectAttempt;
};

#endif

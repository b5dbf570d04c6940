#ifndef CONTROL_PORTAL_H
#define CONTROL_PORTAL_H

#include <Arduino.h>
#include <ESPAsyncWebServer.h>
#include <ArduinoJson.h>
#include "ConfigManager.h"
#include "ControlGateway.h"

class ControlPortal {
public:
    ControlPortal(ControlGateway& gateway, ConfigManager& configManager);

    void begin();

private:
    ControlGateway& gateway;
    ConfigManager& configManager;
    AsyncWebServer server;
    bool active;

    void setupRoutes();

    // Route handlers
    void handleRoot(AsyncWebServerRequest *request);
    void handleStatus(AsyncWebServerRequest *request);
    void handleControl(AsyncWebServerRequest *request);
    void handleControlJson(AsyncWebServerRequest *request, uint8_t *data, size_t len,
                           size_t index, size_t total);
    void handleSettingsPage(AsyncWebServerRequest *request);
    void handleSaveSettings(AsyncWebServerRequest *request);
    void handleRestart(AsyncWebServerRequest *request);
    void handleFactoryReset(AsyncWebServerRequest *request);

    // Shared by the form and JSON control routes
    int runAction(const String& action, String& outMessage);

    void fillStatus(JsonDocument& doc);
    String getTimestamp();

    // HTML template generators
    String generateHeader(const String& title, const String& activePage);
    String generateFooter();
    String generateNavigation(const String& activePage);
};

#endif

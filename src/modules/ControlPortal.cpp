#include "ControlPortal.h"
#include "config.h"
#include "Log.h"
#include <WiFi.h>
#include <time.h>

#define TAG "PORTAL"

// Largest JSON control body accepted in one chunk
#define MAX_CONTROL_BODY 128

ControlPortal::ControlPortal(ControlGateway& gateway, ConfigManager& configManager)
    : gateway(gateway), configManager(configManager), server(WEB_PORT), active(false) {
}

void ControlPortal::begin() {
    if (active) return;

    setupRoutes();
    server.begin();

    active = true;
    logLine(TAG, "Control portal started on port %d", WEB_PORT);
}

void ControlPortal::setupRoutes() {
    server.on("/", HTTP_GET, [this](AsyncWebServerRequest *request) {
        this->handleRoot(request);
    });

    server.on("/status.json", HTTP_GET, [this](AsyncWebServerRequest *request) {
        this->handleStatus(request);
    });

    server.on("/control", HTTP_POST, [this](AsyncWebServerRequest *request) {
        this->handleControl(request);
    });

    // JSON body: {"action": "open" | "close"}
    server.on("/api/control", HTTP_POST,
        [](AsyncWebServerRequest *request) {},
        NULL,
        [this](AsyncWebServerRequest *request, uint8_t *data, size_t len,
               size_t index, size_t total) {
            this->handleControlJson(request, data, len, index, total);
        });

    server.on("/settings", HTTP_GET, [this](AsyncWebServerRequest *request) {
        this->handleSettingsPage(request);
    });

    server.on("/settings", HTTP_POST, [this](AsyncWebServerRequest *request) {
        this->handleSaveSettings(request);
    });

    server.on("/restart", HTTP_POST, [this](AsyncWebServerRequest *request) {
        this->handleRestart(request);
    });

    server.on("/factory-reset", HTTP_POST, [this](AsyncWebServerRequest *request) {
        this->handleFactoryReset(request);
    });

    server.onNotFound([](AsyncWebServerRequest *request) {
        request->redirect("/");
    });
}

// ============================================
// Route Handlers
// ============================================

void ControlPortal::handleRoot(AsyncWebServerRequest *request) {
    BarrierSnapshot snapshot = gateway.status();

    String html = generateHeader("Dashboard", "home");

    html += "<div class='card'>";
    html += "<h2>Parking Barrier</h2>";
    html += "<p class='subtitle'>" + getTimestamp() + "</p>";
    html += "<table>";
    html += "<tr><td>Barrier:</td><td>" + String(barrierPositionName(snapshot.position)) + "</td></tr>";
    html += "<tr><td>Vehicles parked:</td><td>" + String(snapshot.vehicleCount) + "</td></tr>";
    html += "<tr><td>Sequence:</td><td>" + String(pendingTransitionName(snapshot.pending)) + "</td></tr>";
    if (snapshot.actuatorFault) {
        html += "<tr><td>Actuator:</td><td class='warning'>⚠ FAULT - check the barrier</td></tr>";
    }
    html += "</table>";
    html += "</div>";

    html += "<div class='card'>";
    html += "<h3>Manual Control</h3>";
    html += "<form method='POST' action='/control' style='display:inline'>";
    html += "<button type='submit' name='open' value='1' class='btn btn-primary'>Open Barrier</button>";
    html += "</form> ";
    html += "<form method='POST' action='/control' style='display:inline'>";
    html += "<button type='submit' name='close' value='1' class='btn btn-danger'>Close Barrier</button>";
    html += "</form>";
    html += "<small>Close is refused while a vehicle is detected or a crossing is in progress.</small>";
    html += "</div>";

    html += generateFooter();

    request->send(200, "text/html; charset=UTF-8", html);
}

void ControlPortal::handleStatus(AsyncWebServerRequest *request) {
    JsonDocument doc;
    fillStatus(doc);

    String json;
    serializeJson(doc, json);
    request->send(200, "application/json", json);
}

void ControlPortal::handleControl(AsyncWebServerRequest *request) {
    String action;
    if (request->hasParam("close", true)) {
        action = "close";
    } else if (request->hasParam("open", true)) {
        action = "open";
    }

    String message;
    int code = runAction(action, message);

    String html = generateHeader("Control", "home");
    html += "<div class='card'>";
    html += code == 200 ? "<h2>✓ " : "<h2 class='warning'>✗ ";
    html += message + "</h2>";
    html += "<a href='/' class='btn'>Back to Dashboard</a>";
    html += "</div>";
    html += generateFooter();

    request->send(code, "text/html; charset=UTF-8", html);
}

void ControlPortal::handleControlJson(AsyncWebServerRequest *request, uint8_t *data, size_t len,
                                      size_t index, size_t total) {
    if (index != 0 || len != total || total > MAX_CONTROL_BODY) {
        request->send(413, "application/json", "{\"error\":\"body too large\"}");
        return;
    }

    JsonDocument body;
    DeserializationError error = deserializeJson(body, (const char*)data, len);
    if (error) {
        logLine(TAG, "Bad control body: %s", error.c_str());
        request->send(400, "application/json", "{\"error\":\"invalid json\"}");
        return;
    }

    String action = body["action"] | "";
    String message;
    int code = runAction(action, message);

    JsonDocument doc;
    doc["accepted"] = (code == 200);
    doc["message"] = message;
    fillStatus(doc);

    String json;
    serializeJson(doc, json);
    request->send(code, "application/json", json);
}

int ControlPortal::runAction(const String& action, String& outMessage) {
    if (action == "open") {
        if (gateway.requestOpen()) {
            outMessage = "Barrier opened";
            return 200;
        }
        outMessage = "Actuator fault while opening";
        return 500;
    }

    if (action == "close") {
        ManualCloseResult result = gateway.requestClose();
        switch (result) {
            case ManualCloseResult::Closed:
                outMessage = "Barrier closed";
                return 200;
            case ManualCloseResult::RejectedVehiclePresent:
                outMessage = "Close refused: vehicle present";
                return 409;
            case ManualCloseResult::RejectedSequenceInProgress:
                outMessage = "Close refused: crossing in progress";
                return 409;
            case ManualCloseResult::ActuatorFault:
                outMessage = "Actuator fault while closing";
                return 500;
        }
    }

    logLine(TAG, "Unknown control action: '%s'", action.c_str());
    outMessage = "Unknown action";
    return 400;
}

void ControlPortal::handleSettingsPage(AsyncWebServerRequest *request) {
    DeviceConfiguration config;
    if (!configManager.load(config)) {
        logLine(TAG, "No stored settings - showing defaults");
    }
    const BarrierConfig& b = config.barrier;

    String html = generateHeader("Settings", "settings");

    html += "<div class='card'>";
    html += "<h2>Settings</h2>";
    html += "<form method='POST' action='/settings'>";

    html += "<h3>WiFi</h3>";
    html += "<div class='form-group'><label>WiFi SSID:</label>";
    html += "<input type='text' name='wifi_ssid' value='" + String(config.wifi_ssid) + "' required maxlength='31'></div>";
    html += "<div class='form-group'><label>WiFi Password:</label>";
    html += "<input type='password' name='wifi_password' value='" + String(config.wifi_password) + "' maxlength='63'>";
    html += "<small>Leave empty for open network</small></div>";
    html += "<div class='form-group'><label>Hostname:</label>";
    html += "<input type='text' name='hostname' value='" + String(config.hostname) + "' required maxlength='31'></div>";

    html += "<h3>Sensors</h3>";
    html += "<div class='form-group'><label>Distance threshold (cm):</label>";
    html += "<input type='number' step='0.5' name='dist_cm' value='" + String(b.distanceThresholdCm, 1) + "'></div>";
    html += "<div class='form-group'><label>Samples per reading:</label>";
    html += "<input type='number' name='samples' value='" + String(b.debounceSampleCount) + "'></div>";
    html += "<div class='form-group'><label>Quorum:</label>";
    html += "<input type='number' name='quorum' value='" + String(b.debounceQuorum) + "'>";
    html += "<small>Near samples needed to report a vehicle</small></div>";
    html += "<div class='form-group'><label>Delay between samples (ms):</label>";
    html += "<input type='number' name='sample_ms' value='" + String(b.interSampleDelayMs) + "'></div>";
    html += "<div class='form-group'><label>Poll interval (ms):</label>";
    html += "<input type='number' name='poll_ms' value='" + String(b.sensorPollIntervalMs) + "'></div>";
    html += "<div class='form-group'><label>Echo timeout (ms):</label>";
    html += "<input type='number' name='echo_ms' value='" + String(b.echoTimeoutMs) + "'></div>";

    html += "<h3>Barrier</h3>";
    html += "<div class='form-group'><label>Crossing timeout (s):</label>";
    html += "<input type='number' name='pending_s' value='" + String(b.pendingTransitionTimeoutS) + "'></div>";
    html += "<div class='form-group'><label>Auto close after manual open (s):</label>";
    html += "<input type='number' name='manual_s' value='" + String(b.manualAutoCloseTimeoutS) + "'></div>";

    html += "<button type='submit' class='btn btn-primary'>Save Settings</button>";
    html += "<small>Settings apply after restart.</small>";
    html += "</form>";
    html += "</div>";

    html += "<div class='card'>";
    html += "<h3>Restart</h3>";
    html += "<form method='POST' action='/restart'>";
    html += "<button type='submit' class='btn btn-danger'>Restart Now</button>";
    html += "</form>";
    html += "<form method='POST' action='/factory-reset' style='margin-top:10px'>";
    html += "<button type='submit' class='btn btn-danger'>Factory Reset</button>";
    html += "<small>Erases WiFi and barrier settings, then restarts on defaults.</small>";
    html += "</form>";
    html += "</div>";

    html += generateFooter();

    request->send(200, "text/html; charset=UTF-8", html);
}

void ControlPortal::handleSaveSettings(AsyncWebServerRequest *request) {
    DeviceConfiguration config;
    if (!configManager.load(config)) {
        logLine(TAG, "No stored settings - editing defaults");
    }
    BarrierConfig& b = config.barrier;

    if (request->hasParam("wifi_ssid", true)) {
        request->getParam("wifi_ssid", true)->value().toCharArray(config.wifi_ssid, sizeof(config.wifi_ssid));
    }
    if (request->hasParam("wifi_password", true)) {
        request->getParam("wifi_password", true)->value().toCharArray(config.wifi_password, sizeof(config.wifi_password));
    }
    if (request->hasParam("hostname", true)) {
        request->getParam("hostname", true)->value().toCharArray(config.hostname, sizeof(config.hostname));
    }
    if (request->hasParam("dist_cm", true)) {
        b.distanceThresholdCm = request->getParam("dist_cm", true)->value().toFloat();
    }

    // Parsed as long and range-checked before narrowing into the struct
    static const char* const integerKeys[] = {
        "samples", "quorum", "sample_ms", "poll_ms", "echo_ms", "pending_s", "manual_s"
    };
    bool inputOk = true;
    for (size_t i = 0; i < sizeof(integerKeys) / sizeof(integerKeys[0]); i++) {
        if (!request->hasParam(integerKeys[i], true)) continue;
        long value = request->getParam(integerKeys[i], true)->value().toInt();
        if (!setBarrierSetting(b, integerKeys[i], value)) {
            inputOk = false;
        }
    }

    String html;
    if (inputOk && configManager.save(config)) {
        html = generateHeader("Settings Saved", "settings");
        html += "<div class='card'>";
        html += "<h2>✓ Settings Saved Successfully</h2>";
        html += "<p>Restart the device to apply them.</p>";
        html += "<a href='/' class='btn'>Back to Dashboard</a> ";
        html += "<a href='/settings' class='btn btn-primary'>Back to Settings</a>";
        html += "</div>";
        html += generateFooter();
        request->send(200, "text/html; charset=UTF-8", html);
    } else {
        html = generateHeader("Error", "settings");
        html += "<div class='card'>";
        html += "<h2>✗ Save Failed</h2>";
        html += "<p>One of the values is out of range. Please check your input and try again.</p>";
        html += "<a href='javascript:history.back()' class='btn'>Go Back</a>";
        html += "</div>";
        html += generateFooter();
        request->send(400, "text/html; charset=UTF-8", html);
    }
}

void ControlPortal::handleRestart(AsyncWebServerRequest *request) {
    String html = generateHeader("Restarting", "");
    html += "<div class='card'>";
    html += "<h2>Device Restarting</h2>";
    html += "<p>The barrier controller is restarting with the saved settings...</p>";
    html += "<script>setTimeout(function(){ window.location.href='/'; }, 15000);</script>";
    html += "</div>";
    html += generateFooter();

    request->send(200, "text/html; charset=UTF-8", html);

    logLine(TAG, "Restart requested from portal");
    delay(2000);
    ESP.restart();
}

void ControlPortal::handleFactoryReset(AsyncWebServerRequest *request) {
    if (!configManager.factoryReset()) {
        String html = generateHeader("Error", "settings");
        html += "<div class='card'>";
        html += "<h2>✗ Factory Reset Failed</h2>";
        html += "<p>Stored settings could not be erased.</p>";
        html += "<a href='/settings' class='btn'>Back to Settings</a>";
        html += "</div>";
        html += generateFooter();
        request->send(500, "text/html; charset=UTF-8", html);
        return;
    }

    String html = generateHeader("Restarting", "");
    html += "<div class='card'>";
    html += "<h2>Settings Erased</h2>";
    html += "<p>The controller restarts on default settings. Reconnect to its access point if WiFi fails.</p>";
    html += "</div>";
    html += generateFooter();

    request->send(200, "text/html; charset=UTF-8", html);

    logLine(TAG, "Factory reset from portal - restarting");
    delay(2000);
    ESP.restart();
}

// ============================================
// Helpers
// ============================================

void ControlPortal::fillStatus(JsonDocument& doc) {
    BarrierSnapshot snapshot = gateway.status();

    doc["barrierPosition"] = barrierPositionName(snapshot.position);
    doc["vehicleCount"] = snapshot.vehicleCount;
    doc["pending"] = pendingTransitionName(snapshot.pending);
    doc["actuatorFault"] = snapshot.actuatorFault;
    doc["timestamp"] = getTimestamp();
}

String ControlPortal::getTimestamp() {
    struct tm timeinfo;
    if (!getLocalTime(&timeinfo, 10)) {
        // No NTP sync (e.g. fallback AP mode): report uptime instead
        return "uptime+" + String(millis() / 1000) + "s";
    }

    char buffer[25];
    memset(buffer, 0, sizeof(buffer));
    strftime(buffer, sizeof(buffer) - 1, "%Y-%m-%dT%H:%M:%SZ", &timeinfo);
    return String(buffer);
}

String ControlPortal::generateHeader(const String& title, const String& activePage) {
    String html = "<!DOCTYPE html><html><head>";
    html += "<meta charset='UTF-8'>";
    html += "<meta name='viewport' content='width=device-width, initial-scale=1.0'>";
    if (activePage == "home") {
        html += "<meta http-equiv='refresh' content='5; url=/'>";
    }
    html += "<title>" + title + " - Parking Barrier</title>";
    html += "<style>";
    html += "* { margin: 0; padding: 0; box-sizing: border-box; }";
    html += "body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; background: #f5f5f5; padding: 20px; }";
    html += ".container { max-width: 800px; margin: 0 auto; }";
    html += ".card { background: white; border-radius: 8px; padding: 20px; margin-bottom: 20px; box-shadow: 0 2px 4px rgba(0,0,0,0.1); }";
    html += "h1, h2, h3 { color: #333; margin-bottom: 10px; }";
    html += ".subtitle { color: #666; font-size: 14px; }";
    html += "table { width: 100%; border-collapse: collapse; margin-top: 10px; }";
    html += "table td { padding: 8px; border-bottom: 1px solid #eee; }";
    html += "table td:first-child { font-weight: 500; color: #666; width: 40%; }";
    html += ".nav { display: flex; gap: 10px; margin-bottom: 20px; flex-wrap: wrap; }";
    html += ".nav a { padding: 10px 15px; background: white; border-radius: 5px; text-decoration: none; color: #333; box-shadow: 0 1px 3px rgba(0,0,0,0.1); }";
    html += ".nav a.active { background: #007bff; color: white; }";
    html += ".form-group { margin-bottom: 15px; }";
    html += "label { display: block; margin-bottom: 5px; font-weight: 500; color: #333; }";
    html += "input[type='text'], input[type='password'], input[type='number'] { width: 100%; padding: 10px; border: 1px solid #ddd; border-radius: 5px; font-size: 14px; }";
    html += "small { display: block; margin-top: 5px; color: #666; font-size: 12px; }";
    html += ".btn { display: inline-block; padding: 10px 20px; background: #007bff; color: white; border: none; border-radius: 5px; cursor: pointer; text-decoration: none; font-size: 14px; }";
    html += ".btn-primary { background: #28a745; }";
    html += ".btn-danger { background: #dc3545; }";
    html += ".warning { color: #dc3545; font-weight: 500; }";
    html += "</style>";
    html += "</head><body>";
    html += "<div class='container'>";
    html += generateNavigation(activePage);
    return html;
}

String ControlPortal::generateNavigation(const String& activePage) {
    String nav = "<div class='nav'>";

    nav += "<a href='/'";
    if (activePage == "home") nav += " class='active'";
    nav += ">Dashboard</a>";

    nav += "<a href='/settings'";
    if (activePage == "settings") nav += " class='active'";
    nav += ">Settings</a>";

    nav += "<a href='/status.json'>Status JSON</a>";

    nav += "</div>";
    return nav;
}

String ControlPortal::generateFooter() {
    String html = "<div class='card' style='text-align: center; color: #999; font-size: 12px;'>";
    html += "<p>Parking Barrier Controller v" + String(FIRMWARE_VERSION) + "</p>";
    html += "</div>";
    html += "</div></body></html>";
    return html;
}

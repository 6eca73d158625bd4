/*
================================================================================
PduLink Controller - PDU telnet CLI bridge
================================================================================

Keeps telnet CLI sessions to up to four PDUs and mirrors their outlets,
groups and sensors into a browser control panel on ws://<ip>/ws.

Valid Commands (slot is 1-4, defaults to 1):
  { "command": "toggleOutlet", "slot": 1, "index": 3 }
  { "command": "toggleGroup", "slot": 1, "index": 2 }
  { "command": "cycleOutlet", "slot": 1, "index": 3 }
  { "command": "cycleGroup", "slot": 1, "index": 2 }
  { "command": "confirm", "slot": 1 }
  { "command": "cancel", "slot": 1 }
  { "command": "setMode", "slot": 1, "mode": "OnOff" | "Cycle" }
  { "command": "triggerGroup", "slot": 1, "name": "Radios" }
  { "command": "connect", "slot": 1, "value": true }
  { "command": "resetState", "slot": 1 }
  { "command": "getEndpoint", "slot": 1 }
  { "command": "setEndpoint", "slot": 1, "host": "192.168.1.50", "port": 23,
    "username": "admin", "password": "...", "prompt": "[My PDU] #",
    "autoConnect": true, "receiver": "cycle" | "on" }
  { "command": "setDeviceName", "value": "Rack A" }
  { "command": "setDeviceId", "value": 1-99 }
  { "command": "getState" }
  { "command": "reboot" }

Features:
- Persistent endpoint and device configuration in NVS
- Group power cycles coordinated across PDUs and peer controllers (UDP 4211)
- Event-driven web interface updates
- WiFi configuration portal
- OTA firmware updates
================================================================================
*/

#include <Arduino.h>
#include <ArduinoOTA.h>
#include <ESPAsyncWebServer.h>
#include <SPIFFS.h>
#include <WiFi.h>
#include <esp_task_wdt.h>

#include "config.h"
#include "logger.h"
#include "device_state.h"
#include "event_manager.h"
#include "network_manager.h"
#include "session_manager.h"
#include "system_utils.h"
#include "web_server_manager.h"

AsyncWebServer httpServer(HTTP_PORT);

// -------------------------------------------------------------------------
// Log forwarding
// -------------------------------------------------------------------------
void forwardLogLine(LogLevel level, const std::string &line)
{
    if (level >= LogLevel::INFO)
    {
        EventManager::triggerLogLine(String(line.c_str()));
    }
}

void initFileSystem()
{
    if (!SPIFFS.begin(false))
    {
        LOG_ERROR("SPIFFS mount failed - web interface unavailable");
        return;
    }
    LOG_INFO("SPIFFS mounted successfully");

    if (!SPIFFS.exists("/index.html"))
    {
        LOG_WARNING("/index.html missing from SPIFFS - upload the data directory");
    }
}

void initOta()
{
    ArduinoOTA.setHostname(MDNS_NAME);
    ArduinoOTA.onStart([]()
                       {
                           LOG_INFO("OTA update starting...");
                           // Disable watchdog timer during OTA to prevent resets
                           esp_task_wdt_deinit(); });
    ArduinoOTA.onEnd([]()
                     { LOG_INFO("OTA update complete"); });
    ArduinoOTA.onProgress([](unsigned int progress, unsigned int total)
                          { Serial.printf("OTA Progress: %u%%\r", (progress * 100) / total); });
    ArduinoOTA.onError([](ota_error_t error)
                       {
        if (error == OTA_AUTH_ERROR) LOG_ERROR("OTA Error: Authentication Failed");
        else if (error == OTA_BEGIN_ERROR) LOG_ERROR("OTA Error: Begin Failed");
        else if (error == OTA_CONNECT_ERROR) LOG_ERROR("OTA Error: Connect Failed");
        else if (error == OTA_RECEIVE_ERROR) LOG_ERROR("OTA Error: Receive Failed");
        else if (error == OTA_END_ERROR) LOG_ERROR("OTA Error: End Failed");
        else LOG_ERROR("OTA Error: " + std::to_string(error)); });
    ArduinoOTA.begin();
    LOG_INFO("OTA update service started");
}

void setup()
{
    Serial.begin(115200);
    delay(100);

    Logger::init(LogLevel::INFO);
    Logger::setSink(forwardLogLine);

    LOG_INFO(std::string(NAME) + " " + VERSION + " starting");

    DeviceState::init();
    initFileSystem();

    NetworkManager::startWiFi();
    NetworkManager::startMdns();
    NetworkManager::init();

    EventManager::init();

    SessionManager::init();
    NetworkManager::attachBroadcastChannel(SessionManager::getChannel());

    WebServerManager::init(&httpServer);
    httpServer.begin();
    LOG_INFO("HTTP server started on port " + std::to_string(HTTP_PORT));

    initOta();

    SystemUtils::logBootSummary();

    LOG_INFO("Device ID " + std::to_string(DeviceState::getDeviceConfig().deviceId) + " ready at http://" +
             std::string(WiFi.localIP().toString().c_str()));
}

void loop()
{
    ArduinoOTA.handle();

    NetworkManager::update();
    WebServerManager::processIntents();
    SessionManager::update();

    if (EventManager::isSystemStatusTriggered())
    {
        EventManager::clearSystemStatusFlag();
        EventManager::triggerSystemStatus();

        if (SystemUtils::isLowMemory())
        {
            LOG_WARNING("Free heap below " + std::to_string(CRITICAL_HEAP_THRESHOLD) + " bytes: " +
                        std::to_string(SystemUtils::getFreeHeap()));
        }
    }

    EventManager::processEvents();
    SystemUtils::handlePendingReboot();

    delay(1);
}

#pragma once

#include <Arduino.h>
#include <ESPAsyncWebServer.h>
#include <ArduinoJson.h>
#include <freertos/semphr.h>

// -------------------------------------------------------------------------
// Web Server Module
// -------------------------------------------------------------------------
// HTTP routes and browser WebSocket commands. Request handlers run on the
// AsyncTCP task, so WebSocket commands are only queued there and executed
// by processIntents() on the loop task, next to the sessions they drive.

struct WebIntent
{
    uint32_t clientId;
    String message;
};

class WebServerManager
{
private:
    static AsyncWebServer *httpServer;
    static bool initialized;

    static const uint8_t INTENT_QUEUE_SIZE = 16;
    static WebIntent intentQueue[INTENT_QUEUE_SIZE];
    static uint8_t intentHead;
    static uint8_t intentTail;
    static uint32_t droppedIntents;
    static SemaphoreHandle_t intentLock;

public:
    // Initialization
    static void init(AsyncWebServer *server);

    // HTTP request handlers
    static void handleRoot(AsyncWebServerRequest *request);
    static void handleStatusJson(AsyncWebServerRequest *request);
    static void handlePanelJson(AsyncWebServerRequest *request);
    static void handleReboot(AsyncWebServerRequest *request);
    static void handleFactoryReset(AsyncWebServerRequest *request);
    static void handleFavicon(AsyncWebServerRequest *request);

    // WebSocket event entry point (AsyncTCP task)
    static void onWsEvent(AsyncWebSocket *server, AsyncWebSocketClient *client, AwsEventType type,
                          void *arg, uint8_t *data, size_t len);

    // Drains queued WebSocket commands (loop task)
    static void processIntents();

    // Route setup
    static void setupRoutes();

    // Utility functions
    static void sendJsonResponse(uint32_t clientId, const String &response);
    static void sendErrorResponse(uint32_t clientId, const String &error);

private:
    static bool queueIntent(uint32_t clientId, const String &message);
    static bool takeIntent(WebIntent &intent);

    static void handleWebSocketMessage(uint32_t clientId, const String &message);
    static void handleJsonCommand(uint32_t clientId, const JsonDocument &json);
    static bool handleSessionCommand(uint32_t clientId, const char *cmd, const JsonDocument &json);
    static void handleSetEndpoint(uint32_t clientId, uint8_t slot, const JsonDocument &json);
    static void sendFullState(uint32_t clientId);
    static bool slotFromJson(const JsonDocument &json, uint8_t &slot);
};

#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>
#include "config.h"
#include "pdu_session.h"

// -------------------------------------------------------------------------
// JSON Response Builder
// -------------------------------------------------------------------------
class JsonBuilder
{
private:
    static constexpr size_t PANEL_JSON_SIZE = 6144;
    static constexpr size_t STATUS_JSON_SIZE = 2048;
    static constexpr size_t ENDPOINT_JSON_SIZE = 512;
    static constexpr size_t RESPONSE_JSON_SIZE = 384;

public:
    // Full control panel of one endpoint (toggles, indicators, sensors)
    static String buildPanelResponse(uint8_t slot);

    // Device and per-session health summary
    static String buildStatusResponse();

    // Stored endpoint settings, password masked
    static String buildEndpointResponse(uint8_t slot);

    // Build simple response messages
    static String buildInfoResponse(const String &message);
    static String buildErrorResponse(const String &message);
    static String buildLogResponse(const String &line);

private:
    static void addSessionHealth(JsonObject obj, const PduSession &session);
    static void addSystemInfo(JsonDocument &doc);
    static String serialize(const JsonDocument &doc, const char *what);
};

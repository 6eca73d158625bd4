#include "json_builder.h"
#include "device_state.h"
#include "logger.h"
#include "session_manager.h"
#include "system_utils.h"
#include <WiFi.h>
#include <esp_system.h>

String JsonBuilder::serialize(const JsonDocument &doc, const char *what)
{
    if (doc.overflowed())
    {
        LOG_WARNING(std::string("JSON document overflowed while building ") + what);
    }

    String result;
    if (serializeJson(doc, result) == 0)
    {
        LOG_ERROR(std::string("Failed to serialize ") + what + " JSON");
        return "{}";
    }
    return result;
}

String JsonBuilder::buildPanelResponse(uint8_t slot)
{
    PduSession *session = SessionManager::getSession(slot);
    if (!session)
    {
        return buildErrorResponse("Unknown endpoint slot " + String(slot + 1));
    }

    const ControlPanel &panel = session->getPanel();
    const SessionFlags &flags = session->getFlags();
    const ConfirmationManager &confirmations = session->getConfirmations();

    DynamicJsonDocument doc(PANEL_JSON_SIZE);
    doc["type"] = "panel";
    doc["slot"] = slot + 1;
    doc["tag"] = session->getTag().c_str();
    doc["host"] = session->getConfig().host.c_str();
    doc["status"] = panel.getStatus().c_str();
    doc["statusLevel"] = ControlPanel::statusLevelToString(panel.getStatusLevel());
    doc["connected"] = flags.connected;
    doc["loggedIn"] = flags.authenticated;
    doc["stayConnected"] = flags.stayConnected;
    doc["processing"] = panel.isProcessing();
    doc["waiting"] = panel.isWaiting();
    doc["confirmEnabled"] = panel.isConfirmEnabled();
    doc["controlsLocked"] = panel.areControlsLocked();
    doc["mode"] = ControlPanel::modeToString(panel.getMode());
    doc["pending"] = confirmations.isArmed() ? confirmations.getPending().description.c_str() : "";
    doc["broadcastActive"] = session->getBroadcast().isProcessing();

    JsonObject sensors = doc.createNestedObject("sensors");
    sensors["current"] = panel.sensors().current.c_str();
    sensors["activePower"] = panel.sensors().activePower.c_str();
    sensors["temperature"] = panel.sensors().temperature.c_str();
    sensors["humidity"] = panel.sensors().humidity.c_str();

    JsonArray outlets = doc.createNestedArray("outlets");
    for (uint8_t i = 1; i <= MAX_OUTLETS; i++)
    {
        const OutletControl &outlet = panel.getOutlet(i);
        JsonObject item = outlets.createNestedObject();
        item["index"] = i;
        item["name"] = outlet.name.c_str();
        item["on"] = outlet.powered;
        item["known"] = outlet.known;
        item["enabled"] = panel.isOutletInputEnabled(i);
    }

    JsonArray groups = doc.createNestedArray("groups");
    for (uint8_t i = 1; i <= MAX_GROUPS; i++)
    {
        const GroupControl &group = panel.getGroup(i);
        JsonObject item = groups.createNestedObject();
        item["index"] = i;
        item["name"] = group.name.c_str();
        item["on"] = group.powered;
        item["unused"] = group.unused;
        item["enabled"] = panel.isGroupInputEnabled(i);
    }

    return serialize(doc, "panel");
}

String JsonBuilder::buildStatusResponse()
{
    DynamicJsonDocument doc(STATUS_JSON_SIZE);
    const auto &deviceConfig = DeviceState::getDeviceConfig();

    doc["type"] = "status";
    doc["uptime"] = SystemUtils::getUptime();
    doc["deviceName"] = deviceConfig.deviceName;
    doc["deviceId"] = deviceConfig.deviceId;
    doc["ip"] = WiFi.localIP().toString();

    JsonArray sessions = doc.createNestedArray("sessions");
    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        PduSession *session = SessionManager::getSession(slot);
        if (!session)
        {
            continue;
        }
        JsonObject item = sessions.createNestedObject();
        item["slot"] = slot + 1;
        addSessionHealth(item, *session);
    }

    // Add system info
    addSystemInfo(doc);

    return serialize(doc, "status");
}

String JsonBuilder::buildEndpointResponse(uint8_t slot)
{
    const EndpointSettings &endpoint = DeviceState::getEndpoint(slot);
    const SessionConfig &config = endpoint.session;

    DynamicJsonDocument doc(ENDPOINT_JSON_SIZE);
    doc["type"] = "endpoint";
    doc["slot"] = slot + 1;
    doc["tag"] = config.tag.c_str();
    doc["host"] = config.host.c_str();
    doc["port"] = config.port;
    doc["username"] = config.username.c_str();
    doc["hasPassword"] = !config.password.empty();
    doc["prompt"] = config.prompt.c_str();
    doc["autoConnect"] = config.connectOnStart;
    doc["receiver"] = SessionConfig::receiverActionToString(config.receiverAction);
    doc["mode"] = ControlPanel::modeToString(endpoint.mode);

    return serialize(doc, "endpoint");
}

String JsonBuilder::buildInfoResponse(const String &message)
{
    DynamicJsonDocument doc(RESPONSE_JSON_SIZE);
    doc["type"] = "info";
    doc["msg"] = message;

    String result;
    serializeJson(doc, result);
    return result;
}

String JsonBuilder::buildErrorResponse(const String &message)
{
    DynamicJsonDocument doc(RESPONSE_JSON_SIZE);
    doc["type"] = "error";
    doc["msg"] = message;

    String result;
    serializeJson(doc, result);
    return result;
}

String JsonBuilder::buildLogResponse(const String &line)
{
    DynamicJsonDocument doc(RESPONSE_JSON_SIZE);
    doc["type"] = "log";
    doc["line"] = line;

    String result;
    serializeJson(doc, result);
    return result;
}

void JsonBuilder::addSessionHealth(JsonObject obj, const PduSession &session)
{
    SessionHealth health = session.getHealth();

    obj["tag"] = session.getTag().c_str();
    obj["host"] = session.getConfig().host.c_str();
    obj["port"] = session.getConfig().port;
    obj["connected"] = health.connected;
    obj["loggedIn"] = health.authenticated;
    obj["polling"] = health.pollingActive;
    obj["awaitingResponse"] = health.awaitingResponse;
    obj["reconnectAttempts"] = health.reconnectAttempts;
    obj["commandsSent"] = health.performance.commandsSent;
    obj["responsesReceived"] = health.performance.responsesReceived;
    obj["errors"] = health.errors.total();
    obj["authErrors"] = health.errors.authenticationErrors;
    obj["lastError"] = errorTypeToString(health.errors.lastErrorType);
}

void JsonBuilder::addSystemInfo(JsonDocument &doc)
{
    const auto &deviceConfig = DeviceState::getDeviceConfig();

    doc["udpPort"] = BROADCAST_UDP_PORT;
    doc["version"] = VERSION;
    doc["chipId"] = SystemUtils::getChipID();
    doc["chipRevision"] = ESP.getChipRevision();
    doc["cpuFreq"] = ESP.getCpuFreqMHz();
    doc["freeHeap"] = SystemUtils::getFreeHeap();
    doc["totalHeap"] = SystemUtils::getTotalHeap();
    doc["flashSize"] = ESP.getFlashChipSize();
    doc["rebootCount"] = deviceConfig.rebootCounter;
    doc["resetReason"] = SystemUtils::getResetReason();
}

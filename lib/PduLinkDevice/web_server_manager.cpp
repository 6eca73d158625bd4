#include "web_server_manager.h"
#include "config.h"
#include "logger.h"
#include "device_state.h"
#include "system_utils.h"
#include "event_manager.h"
#include "network_manager.h"
#include "json_builder.h"
#include "session_manager.h"
#include <SPIFFS.h>
#include <WiFi.h>

// Static member definitions
AsyncWebServer *WebServerManager::httpServer = nullptr;
bool WebServerManager::initialized = false;

WebIntent WebServerManager::intentQueue[INTENT_QUEUE_SIZE];
uint8_t WebServerManager::intentHead = 0;
uint8_t WebServerManager::intentTail = 0;
uint32_t WebServerManager::droppedIntents = 0;
SemaphoreHandle_t WebServerManager::intentLock = nullptr;

void WebServerManager::init(AsyncWebServer *server)
{
    httpServer = server;
    if (intentLock == nullptr)
    {
        intentLock = xSemaphoreCreateMutex();
    }
    setupRoutes();
    NetworkManager::setWebSocketEventHandler(onWsEvent);
    httpServer->addHandler(&NetworkManager::getWebSocket());
    initialized = true;
    LOG_INFO("Web server manager initialized");
}

void WebServerManager::setupRoutes()
{
    if (!httpServer)
        return;

    // Main routes
    httpServer->on("/", HTTP_GET, handleRoot);
    httpServer->on("/api/status", HTTP_GET, handleStatusJson);
    httpServer->on("/api/panel", HTTP_GET, handlePanelJson);
    httpServer->on("/reboot", HTTP_POST, handleReboot);
    httpServer->on("/restore", HTTP_POST, handleFactoryReset);
    httpServer->on("/favicon.ico", HTTP_GET, handleFavicon);

    LOG_INFO("Web server routes configured");
}

void WebServerManager::handleRoot(AsyncWebServerRequest *request)
{
    String page = SystemUtils::loadFile("/index.html");
    if (page.isEmpty())
    {
        request->send(500, "text/plain", "Error loading page");
        return;
    }

    page = SystemUtils::processTemplate(page);
    request->send(200, "text/html", page);
}

void WebServerManager::handleStatusJson(AsyncWebServerRequest *request)
{
    String json = JsonBuilder::buildStatusResponse();
    request->send(200, "application/json", json);
}

void WebServerManager::handlePanelJson(AsyncWebServerRequest *request)
{
    long slot = request->hasArg("slot") ? request->arg("slot").toInt() : 1;
    if (slot < 1 || slot > MAX_ENDPOINTS)
    {
        request->send(400, "application/json", JsonBuilder::buildErrorResponse("Invalid slot"));
        return;
    }

    String json = JsonBuilder::buildPanelResponse(slot - 1);
    request->send(200, "application/json", json);
}

void WebServerManager::handleReboot(AsyncWebServerRequest *request)
{
    request->send(200, "text/plain", "Rebooting device...");
    SystemUtils::requestReboot("HTTP");
}

void WebServerManager::handleFactoryReset(AsyncWebServerRequest *request)
{
    request->send(200, "text/plain", "Completely erasing WiFi credentials...");

    // Complete WiFi reset to ensure captive portal activation
    WiFi.disconnect(true, true); // Erase WiFi creds and reset
    WiFi.mode(WIFI_OFF);         // Turn off WiFi completely
    delay(100);
    WiFi.mode(WIFI_STA); // Set to station mode
    delay(500);
    ESP.restart();
}

void WebServerManager::handleFavicon(AsyncWebServerRequest *request)
{
    // Try to serve favicon from SPIFFS, or return 404
    if (SPIFFS.exists("/favicon.ico"))
    {
        request->send(SPIFFS, "/favicon.ico", "image/x-icon");
    }
    else
    {
        request->send(404, "text/plain", "Favicon not found");
    }
}

void WebServerManager::onWsEvent(AsyncWebSocket *server, AsyncWebSocketClient *client, AwsEventType type,
                                 void *arg, uint8_t *data, size_t len)
{
    switch (type)
    {
    case WS_EVT_CONNECT:
        LOG_INFO("WebSocket client #" + std::to_string(client->id()) + " connected from " +
                 std::string(client->remoteIP().toString().c_str()));
        // Initial state is built on the loop task like everything else
        queueIntent(client->id(), "{\"command\":\"getState\"}");
        break;

    case WS_EVT_DISCONNECT:
        LOG_INFO("WebSocket client #" + std::to_string(client->id()) + " disconnected");
        break;

    case WS_EVT_DATA:
    {
        AwsFrameInfo *info = (AwsFrameInfo *)arg;
        if (info->final && info->index == 0 && info->len == len && info->opcode == WS_TEXT)
        {
            String message;
            message.reserve(len);
            for (size_t i = 0; i < len; i++)
            {
                message += (char)data[i];
            }
            if (!queueIntent(client->id(), message))
            {
                client->text(JsonBuilder::buildErrorResponse("Server busy"));
            }
        }
        else
        {
            LOG_WARNING("Ignoring fragmented or binary WebSocket frame");
        }
        break;
    }

    case WS_EVT_ERROR:
        LOG_WARNING("WebSocket client #" + std::to_string(client->id()) + " error");
        break;

    default:
        break;
    }
}

bool WebServerManager::queueIntent(uint32_t clientId, const String &message)
{
    if (intentLock == nullptr || xSemaphoreTake(intentLock, portMAX_DELAY) != pdTRUE)
    {
        return false;
    }

    uint8_t nextHead = (intentHead + 1) % INTENT_QUEUE_SIZE;
    bool accepted = nextHead != intentTail;

    if (accepted)
    {
        intentQueue[intentHead].clientId = clientId;
        intentQueue[intentHead].message = message;
        intentHead = nextHead;
    }
    else
    {
        // User commands are never silently replaced, the newest one is refused
        droppedIntents++;
    }

    xSemaphoreGive(intentLock);
    return accepted;
}

bool WebServerManager::takeIntent(WebIntent &intent)
{
    if (intentLock == nullptr || xSemaphoreTake(intentLock, portMAX_DELAY) != pdTRUE)
    {
        return false;
    }

    bool available = intentTail != intentHead;
    if (available)
    {
        intent.clientId = intentQueue[intentTail].clientId;
        intent.message = intentQueue[intentTail].message;
        intentQueue[intentTail].message = String();
        intentTail = (intentTail + 1) % INTENT_QUEUE_SIZE;
    }

    xSemaphoreGive(intentLock);
    return available;
}

void WebServerManager::processIntents()
{
    if (!initialized)
    {
        return;
    }

    WebIntent intent;
    while (takeIntent(intent))
    {
        handleWebSocketMessage(intent.clientId, intent.message);
    }

    if (droppedIntents > 0)
    {
        LOG_WARNING("WebSocket command queue full - " + std::to_string(droppedIntents) + " commands refused");
        droppedIntents = 0;
    }
}

void WebServerManager::handleWebSocketMessage(uint32_t clientId, const String &message)
{
    LOG_DEBUG("WebSocket message received: " + std::string(message.c_str()));

    if (!message.startsWith("{"))
    {
        sendErrorResponse(clientId, "Expected a JSON command");
        return;
    }

    DynamicJsonDocument doc(1024);
    DeserializationError error = deserializeJson(doc, message);

    if (error)
    {
        LOG_WARNING("JSON parsing failed: " + std::string(error.c_str()));
        sendErrorResponse(clientId, "Invalid JSON format");
        return;
    }

    handleJsonCommand(clientId, doc);
}

bool WebServerManager::slotFromJson(const JsonDocument &json, uint8_t &slot)
{
    // Slots are 1-based on the wire
    int value = json.containsKey("slot") ? json["slot"].as<int>() : 1;
    if (value < 1 || value > MAX_ENDPOINTS)
    {
        return false;
    }
    slot = value - 1;
    return true;
}

void WebServerManager::handleJsonCommand(uint32_t clientId, const JsonDocument &json)
{
    if (!json.containsKey("command"))
    {
        sendErrorResponse(clientId, "Missing command field");
        return;
    }

    const char *cmd = json["command"];
    if (cmd == nullptr)
    {
        sendErrorResponse(clientId, "Invalid command field");
        return;
    }
    LOG_DEBUG("Processing WebSocket command: " + std::string(cmd));

    if (strcmp(cmd, "getState") == 0)
    {
        sendFullState(clientId);
    }
    // Handle device name change command
    else if (strcmp(cmd, "setDeviceName") == 0)
    {
        if (!json.containsKey("value"))
        {
            sendErrorResponse(clientId, "Missing value field");
            return;
        }
        DeviceState::setDeviceName(json["value"].as<String>());
        sendJsonResponse(clientId, JsonBuilder::buildInfoResponse("Device name updated"));
        EventManager::triggerSystemStatus();
    }
    // Handle device ID change command
    else if (strcmp(cmd, "setDeviceId") == 0)
    {
        if (!json.containsKey("value"))
        {
            sendErrorResponse(clientId, "Missing value field");
            return;
        }

        int newDeviceId = json["value"];
        if (newDeviceId >= MIN_DEVICE_ID && newDeviceId <= MAX_DEVICE_ID && DeviceState::setDeviceId(newDeviceId))
        {
            sendJsonResponse(clientId, JsonBuilder::buildInfoResponse("Device ID changed to " + String(newDeviceId)));
            EventManager::triggerSystemStatus();
        }
        else
        {
            String errorMsg = "Invalid device ID " + String(newDeviceId) +
                              ". Must be between " + String(MIN_DEVICE_ID) +
                              " and " + String(MAX_DEVICE_ID);
            sendErrorResponse(clientId, errorMsg);
        }
    }
    // Handle reboot command
    else if (strcmp(cmd, "reboot") == 0)
    {
        sendJsonResponse(clientId, JsonBuilder::buildInfoResponse("Rebooting device..."));
        SystemUtils::requestReboot("WebSocket");
    }
    else if (!handleSessionCommand(clientId, cmd, json))
    {
        LOG_WARNING("Unknown WebSocket command: " + std::string(cmd));
        sendErrorResponse(clientId, "Unknown command: " + String(cmd));
    }
}

bool WebServerManager::handleSessionCommand(uint32_t clientId, const char *cmd, const JsonDocument &json)
{
    static const char *const sessionCommands[] = {
        "toggleOutlet", "toggleGroup", "cycleOutlet", "cycleGroup", "confirm", "cancel",
        "setMode", "triggerGroup", "connect", "resetState", "getEndpoint", "setEndpoint"};

    bool known = false;
    for (const char *name : sessionCommands)
    {
        if (strcmp(cmd, name) == 0)
        {
            known = true;
            break;
        }
    }
    if (!known)
    {
        return false;
    }

    uint8_t slot = 0;
    if (!slotFromJson(json, slot))
    {
        sendErrorResponse(clientId, "Invalid slot");
        return true;
    }

    PduSession *session = SessionManager::getSession(slot);
    if (!session)
    {
        sendErrorResponse(clientId, "Endpoint slot " + String(slot + 1) + " not available");
        return true;
    }

    int requested = json["index"] | 0;
    uint8_t index = (requested > 0 && requested <= 255) ? requested : 0;
    bool accepted = true;

    if (strcmp(cmd, "toggleOutlet") == 0)
    {
        accepted = session->toggleOutlet(index);
    }
    else if (strcmp(cmd, "toggleGroup") == 0)
    {
        accepted = session->toggleGroup(index);
    }
    else if (strcmp(cmd, "cycleOutlet") == 0)
    {
        accepted = session->cycleOutlet(index);
    }
    else if (strcmp(cmd, "cycleGroup") == 0)
    {
        accepted = session->cycleGroup(index);
    }
    else if (strcmp(cmd, "confirm") == 0)
    {
        accepted = session->confirm();
    }
    else if (strcmp(cmd, "cancel") == 0)
    {
        accepted = session->cancel();
    }
    else if (strcmp(cmd, "setMode") == 0)
    {
        const char *mode = json["mode"] | "";
        if (strcmp(mode, "OnOff") == 0)
        {
            SessionManager::setMode(slot, OperationMode::ON_OFF);
        }
        else if (strcmp(mode, "Cycle") == 0)
        {
            SessionManager::setMode(slot, OperationMode::CYCLE);
        }
        else
        {
            sendErrorResponse(clientId, "Unknown mode: " + String(mode));
            return true;
        }
    }
    else if (strcmp(cmd, "triggerGroup") == 0)
    {
        const char *name = json["name"] | "";
        accepted = session->triggerGroupByName(name);
    }
    else if (strcmp(cmd, "connect") == 0)
    {
        accepted = session->connect(json["value"] | true);
    }
    else if (strcmp(cmd, "resetState") == 0)
    {
        session->resetTransientState();
    }
    else if (strcmp(cmd, "getEndpoint") == 0)
    {
        sendJsonResponse(clientId, JsonBuilder::buildEndpointResponse(slot));
        return true;
    }
    else if (strcmp(cmd, "setEndpoint") == 0)
    {
        handleSetEndpoint(clientId, slot, json);
        return true;
    }

    if (!accepted)
    {
        sendErrorResponse(clientId, String(cmd) + " rejected by " + session->getTag().c_str() + ": " +
                                        session->getPanel().getStatus().c_str());
    }
    return true;
}

void WebServerManager::handleSetEndpoint(uint32_t clientId, uint8_t slot, const JsonDocument &json)
{
    // Start from the stored settings so omitted fields (the password in
    // particular) keep their current value
    SessionConfig config = DeviceState::getEndpoint(slot).session;

    if (json.containsKey("host"))
        config.host = json["host"] | "";
    if (json.containsKey("port"))
        config.port = json["port"].as<uint16_t>();
    if (json.containsKey("username"))
        config.username = json["username"] | "";
    if (json.containsKey("password"))
        config.password = json["password"] | "";
    if (json.containsKey("prompt"))
        config.prompt = json["prompt"] | DEFAULT_PDU_PROMPT;
    if (json.containsKey("autoConnect"))
        config.connectOnStart = json["autoConnect"].as<bool>();
    if (json.containsKey("receiver"))
        config.receiverAction = SessionConfig::receiverActionFromString(json["receiver"] | "cycle");

    String error;
    if (!SessionManager::applyEndpoint(slot, config, error))
    {
        sendErrorResponse(clientId, "Endpoint not saved: " + error);
        return;
    }

    sendJsonResponse(clientId, JsonBuilder::buildEndpointResponse(slot));
    EventManager::triggerPanelChange(slot);
}

void WebServerManager::sendFullState(uint32_t clientId)
{
    sendJsonResponse(clientId, JsonBuilder::buildStatusResponse());
    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        sendJsonResponse(clientId, JsonBuilder::buildEndpointResponse(slot));
        sendJsonResponse(clientId, JsonBuilder::buildPanelResponse(slot));
    }
}

void WebServerManager::sendJsonResponse(uint32_t clientId, const String &response)
{
    AsyncWebSocketClient *client = NetworkManager::getWebSocket().client(clientId);
    if (client && client->status() == WS_CONNECTED)
    {
        client->text(response);
    }
}

void WebServerManager::sendErrorResponse(uint32_t clientId, const String &error)
{
    sendJsonResponse(clientId, JsonBuilder::buildErrorResponse(error));
}

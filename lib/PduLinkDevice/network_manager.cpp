#include "network_manager.h"
#include <ESPmDNS.h>
#include <WiFi.h>
#include <WiFiManager.h>
#include "device_state.h"
#include "event_manager.h"
#include "logger.h"

// Static member definitions
WiFiUDP NetworkManager::udpBridge;
AsyncWebSocket NetworkManager::webSocket("/ws");
BroadcastChannel *NetworkManager::channel = nullptr;
bool NetworkManager::udpReady = false;
uint32_t NetworkManager::datagramsSent = 0;
uint32_t NetworkManager::datagramsReceived = 0;

void NetworkManager::startWiFi()
{
    WiFiManager wifiManager;
    wifiManager.setAPCallback([](WiFiManager *myWiFiManager)
                              {
        LOG_INFO("Entered configuration mode (AP mode)");
        LOG_INFO("AP IP: " + std::string(WiFi.softAPIP().toString().c_str())); });

    wifiManager.setConfigPortalTimeout(CONFIG_PORTAL_TIMEOUT_S);

    if (!wifiManager.autoConnect(WIFI_AP_NAME))
    {
        LOG_CRITICAL("Failed to connect to WiFi, restarting...");
        delay(3000);
        ESP.restart();
        delay(5000);
    }

    WiFi.setSleep(false);
    LOG_INFO("Connected, IP address: " + std::string(WiFi.localIP().toString().c_str()));
}

void NetworkManager::startMdns()
{
    if (!MDNS.begin(MDNS_NAME))
    {
        LOG_ERROR("Error setting up mDNS responder!");
        return;
    }

    MDNS.addService("http", "tcp", HTTP_PORT);
    LOG_INFO(std::string("mDNS responder started: http://") + MDNS_NAME + ".local");
}

void NetworkManager::init()
{
    LOG_INFO("Initializing network manager");

    setupUdpBridge();

    LOG_INFO("Network manager initialized successfully");
}

void NetworkManager::update()
{
    handleUdpBridge();
    webSocket.cleanupClients();
}

void NetworkManager::broadcastToWebClients(const String &message)
{
    if (webSocket.count() > 0)
    {
        webSocket.textAll(message);
    }
}

void NetworkManager::setWebSocketEventHandler(AwsEventHandler handler)
{
    webSocket.onEvent(handler);
}

void NetworkManager::attachBroadcastChannel(BroadcastChannel &broadcastChannel)
{
    channel = &broadcastChannel;

    // Only locally originated messages go out; anything that arrived over
    // UDP was already seen by the peers.
    channel->subscribe([](const BroadcastMessage &message)
                       {
        if (!message.fromNetwork)
        {
            sendDatagram(message);
        } });

    LOG_INFO("Broadcast channel bridged to UDP port " + std::to_string(BROADCAST_UDP_PORT));
}

void NetworkManager::setupUdpBridge()
{
    udpReady = udpBridge.begin(BROADCAST_UDP_PORT);
    if (udpReady)
    {
        LOG_INFO("UDP bridge listening on port " + std::to_string(BROADCAST_UDP_PORT));
    }
    else
    {
        LOG_ERROR("Failed to start UDP bridge on port " + std::to_string(BROADCAST_UDP_PORT));
    }
}

String NetworkManager::localOriginPrefix()
{
    return "d" + String(DeviceState::getDeviceConfig().deviceId) + "-";
}

void NetworkManager::sendDatagram(const BroadcastMessage &message)
{
    if (!udpReady || WiFi.status() != WL_CONNECTED)
    {
        LOG_WARNING("Broadcast for '" + message.groupName + "' not sent to peers - network unavailable");
        return;
    }

    String payload = String(BROADCAST_UDP_TAG) + "," + (message.cancel ? "CANCEL" : "CYCLE") + "," +
                     localOriginPrefix() + message.originId.c_str() + "," + message.groupName.c_str();

    if (!udpBridge.beginPacket(IPAddress(255, 255, 255, 255), BROADCAST_UDP_PORT))
    {
        LOG_ERROR("Failed to open broadcast datagram");
        return;
    }
    udpBridge.print(payload);
    if (!udpBridge.endPacket())
    {
        LOG_ERROR("Failed to send broadcast datagram");
        return;
    }

    datagramsSent++;
    LOG_DEBUG("UDP broadcast sent: '" + std::string(payload.c_str()) + "'");
}

void NetworkManager::handleUdpBridge()
{
    if (!udpReady)
    {
        return;
    }

    int packetSize = udpBridge.parsePacket();
    if (packetSize)
    {
        char packetBuffer[256];
        int len = udpBridge.read(packetBuffer, sizeof(packetBuffer) - 1);
        if (len <= 0)
        {
            return;
        }
        packetBuffer[len] = '\0';

        processUdpMessage(String(packetBuffer), udpBridge.remoteIP());
    }
}

void NetworkManager::processUdpMessage(const String &message, const IPAddress &sender)
{
    LOG_DEBUG("Processing UDP message: '" + std::string(message.c_str()) + "'");

    if (!message.startsWith(String(BROADCAST_UDP_TAG) + ","))
    {
        return;
    }

    // Our own datagrams come back on the broadcast address
    if (sender == WiFi.localIP())
    {
        return;
    }

    int firstComma = message.indexOf(',');
    int secondComma = message.indexOf(',', firstComma + 1);
    int thirdComma = message.indexOf(',', secondComma + 1);

    if (secondComma <= firstComma || thirdComma <= secondComma)
    {
        LOG_WARNING("Malformed broadcast datagram: '" + std::string(message.c_str()) + "'");
        return;
    }

    String action = message.substring(firstComma + 1, secondComma);
    String origin = message.substring(secondComma + 1, thirdComma);
    String groupName = message.substring(thirdComma + 1);

    action.trim();
    origin.trim();
    groupName.trim();

    if (action != "CYCLE" && action != "CANCEL")
    {
        LOG_WARNING("Unknown broadcast action: " + std::string(action.c_str()));
        return;
    }

    if (origin.startsWith(localOriginPrefix()))
    {
        LOG_DEBUG("Ignoring broadcast from this device");
        return;
    }

    if (groupName.isEmpty() || channel == nullptr)
    {
        return;
    }

    datagramsReceived++;
    LOG_INFO("Broadcast from " + std::string(origin.c_str()) + " (" + std::string(sender.toString().c_str()) +
             "): " + std::string(action.c_str()) + " '" + std::string(groupName.c_str()) + "'");

    BroadcastMessage received;
    received.groupName = groupName.c_str();
    received.originId = origin.c_str();
    received.cancel = action == "CANCEL";
    received.fromNetwork = true;
    channel->publish(received);

    EventManager::triggerBroadcast(action + " '" + groupName + "' from " + origin);
}

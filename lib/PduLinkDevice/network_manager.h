#pragma once

#include <Arduino.h>
#include <WiFiUdp.h>
#include <AsyncTCP.h>
#include <ESPAsyncWebServer.h>
#include "broadcast_channel.h"
#include "config.h"

// -------------------------------------------------------------------------
// Network and WebSocket Management Module
// -------------------------------------------------------------------------
// Brings up WiFi and mDNS, hosts the browser WebSocket and bridges the
// in-process broadcast channel to peer controllers over UDP.
//
// Datagram format: "PduLink,CYCLE|CANCEL,<origin>,<group name>"
// The origin is "d<deviceId>-<session tag>", so device IDs have to be
// unique across controllers on the same LAN.

class NetworkManager
{
private:
    static WiFiUDP udpBridge;
    static AsyncWebSocket webSocket;
    static BroadcastChannel *channel;
    static bool udpReady;
    static uint32_t datagramsSent;
    static uint32_t datagramsReceived;

public:
    // Blocks in the captive portal until WiFi is configured, restarts on timeout
    static void startWiFi();
    static void startMdns();
    static void init();
    static void update();

    // WebSocket Server Management
    static AsyncWebSocket &getWebSocket() { return webSocket; }
    static void broadcastToWebClients(const String &message);
    static void setWebSocketEventHandler(AwsEventHandler handler);

    // UDP Broadcast Bridge
    static void attachBroadcastChannel(BroadcastChannel &broadcastChannel);
    static void handleUdpBridge();
    static uint32_t getDatagramsSent() { return datagramsSent; }
    static uint32_t getDatagramsReceived() { return datagramsReceived; }

private:
    static void setupUdpBridge();
    static void sendDatagram(const BroadcastMessage &message);
    static void processUdpMessage(const String &message, const IPAddress &sender);
    static String localOriginPrefix();
};

#pragma once

#include <Arduino.h>
#include <freertos/semphr.h>
#include "config.h"

// -------------------------------------------------------------------------
// Event Manager Module
// -------------------------------------------------------------------------

// Event types for real-time webpage updates
enum WebUpdateEventType
{
    WEB_EVENT_SYSTEM_STATUS,
    WEB_EVENT_LOG_LINE,
    WEB_EVENT_BROADCAST
};

// Event queue structure for efficient web updates
struct WebUpdateEvent
{
    WebUpdateEventType type;
    uint32_t timestamp;
    bool hasData;
    String data;
};

class EventManager
{
private:
    static const uint8_t EVENT_QUEUE_SIZE = 16;
    static WebUpdateEvent eventQueue[EVENT_QUEUE_SIZE];
    static uint8_t queueHead;
    static uint8_t queueTail;
    static bool queueOverflow;
    static SemaphoreHandle_t queueLock;

    // Panel changes are coalesced per slot instead of queued one by one
    static volatile uint32_t dirtyPanels;

    static hw_timer_t *systemStatusTimer;
    static volatile bool systemStatusUpdateTriggered;

public:
    // Initialization
    static void init();

    // Timer management
    static void initTimers();

    // Event queue management
    static void queueEvent(WebUpdateEventType type, const String &data = "");
    static bool getNextEvent(WebUpdateEvent *event);
    static bool hasEvents();
    static void processEvents();

    // Event triggers
    static void triggerPanelChange(uint8_t slot);
    static void triggerSystemStatus();
    static void triggerLogLine(const String &line);
    static void triggerBroadcast(const String &info);

    // Timer interrupt handlers
    static void IRAM_ATTR onSystemStatusTimer();

    // Status checking
    static bool isSystemStatusTriggered() { return systemStatusUpdateTriggered; }
    static void clearSystemStatusFlag() { systemStatusUpdateTriggered = false; }
};

#include "event_manager.h"
#include "json_builder.h"
#include "logger.h"
#include "network_manager.h"

// Static member definitions
WebUpdateEvent EventManager::eventQueue[EVENT_QUEUE_SIZE];
uint8_t EventManager::queueHead = 0;
uint8_t EventManager::queueTail = 0;
bool EventManager::queueOverflow = false;
SemaphoreHandle_t EventManager::queueLock = nullptr;

volatile uint32_t EventManager::dirtyPanels = 0;

hw_timer_t *EventManager::systemStatusTimer = nullptr;
volatile bool EventManager::systemStatusUpdateTriggered = false;

void EventManager::init()
{
    if (queueLock == nullptr)
    {
        queueLock = xSemaphoreCreateMutex();
    }
    initTimers();
    LOG_INFO("Event manager initialized");
}

void EventManager::initTimers()
{
    // System status timer (30 seconds)
    systemStatusTimer = timerBegin(2, 80, true); // Timer 2, prescaler 80 (1MHz), count up
    timerAttachInterrupt(systemStatusTimer, &onSystemStatusTimer, true);
    timerAlarmWrite(systemStatusTimer, 30000000, true); // 30 seconds (30,000,000 microseconds)
    timerAlarmEnable(systemStatusTimer);

    LOG_INFO("Event-driven timers initialized (status: 30s)");
}

void EventManager::queueEvent(WebUpdateEventType type, const String &data)
{
    // Log lines can arrive from the web server task as well as from loop()
    if (queueLock == nullptr || xSemaphoreTake(queueLock, portMAX_DELAY) != pdTRUE)
    {
        return;
    }

    uint8_t nextHead = (queueHead + 1) % EVENT_QUEUE_SIZE;

    if (nextHead == queueTail)
    {
        // Queue is full - drop oldest event
        queueTail = (queueTail + 1) % EVENT_QUEUE_SIZE;
        queueOverflow = true;
    }

    eventQueue[queueHead].type = type;
    eventQueue[queueHead].timestamp = millis();
    eventQueue[queueHead].hasData = !data.isEmpty();
    eventQueue[queueHead].data = data;

    queueHead = nextHead;

    xSemaphoreGive(queueLock);
}

bool EventManager::getNextEvent(WebUpdateEvent *event)
{
    if (queueLock == nullptr || xSemaphoreTake(queueLock, portMAX_DELAY) != pdTRUE)
    {
        return false;
    }

    bool available = queueTail != queueHead;
    if (available)
    {
        *event = eventQueue[queueTail];
        eventQueue[queueTail].data = String();
        queueTail = (queueTail + 1) % EVENT_QUEUE_SIZE;
    }

    xSemaphoreGive(queueLock);
    return available;
}

bool EventManager::hasEvents()
{
    return queueTail != queueHead || dirtyPanels != 0;
}

void EventManager::processEvents()
{
    uint32_t panels = dirtyPanels;
    dirtyPanels = 0;

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        if (panels & (1UL << slot))
        {
            NetworkManager::broadcastToWebClients(JsonBuilder::buildPanelResponse(slot));
        }
    }

    WebUpdateEvent event;

    while (getNextEvent(&event))
    {
        String jsonMessage;

        switch (event.type)
        {
        case WEB_EVENT_SYSTEM_STATUS:
            // Send comprehensive status update
            jsonMessage = JsonBuilder::buildStatusResponse();
            break;

        case WEB_EVENT_LOG_LINE:
            jsonMessage = JsonBuilder::buildLogResponse(event.data);
            break;

        case WEB_EVENT_BROADCAST:
            jsonMessage = JsonBuilder::buildInfoResponse("Broadcast: " + event.data);
            break;

        default:
            continue; // Skip unknown event types
        }

        // Broadcast to all connected WebSocket clients
        if (!jsonMessage.isEmpty())
        {
            NetworkManager::broadcastToWebClients(jsonMessage);
        }
    }

    if (queueOverflow)
    {
        queueOverflow = false;
        LOG_DEBUG("Event queue overflow detected - some events were dropped");
    }
}

void EventManager::triggerPanelChange(uint8_t slot)
{
    if (slot < MAX_ENDPOINTS)
    {
        dirtyPanels |= (1UL << slot);
    }
}

void EventManager::triggerSystemStatus()
{
    queueEvent(WEB_EVENT_SYSTEM_STATUS);
}

void EventManager::triggerLogLine(const String &line)
{
    queueEvent(WEB_EVENT_LOG_LINE, line);
}

void EventManager::triggerBroadcast(const String &info)
{
    queueEvent(WEB_EVENT_BROADCAST, info);
}

// Timer interrupt handlers
void IRAM_ATTR EventManager::onSystemStatusTimer()
{
    systemStatusUpdateTriggered = true;
}

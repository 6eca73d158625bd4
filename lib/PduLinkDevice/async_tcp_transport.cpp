#include "async_tcp_transport.h"
#include "logger.h"

AsyncTcpTransport::AsyncTcpTransport()
{
    eventLock = xSemaphoreCreateMutex();
    attachCallbacks();
}

AsyncTcpTransport::~AsyncTcpTransport()
{
    client.onConnect(nullptr, nullptr);
    client.onData(nullptr, nullptr);
    client.onDisconnect(nullptr, nullptr);
    client.onError(nullptr, nullptr);
    client.onTimeout(nullptr, nullptr);
    client.close(true);
    if (eventLock)
    {
        vSemaphoreDelete(eventLock);
    }
}

void AsyncTcpTransport::attachCallbacks()
{
    client.onConnect([](void *arg, AsyncClient *c)
                     { static_cast<AsyncTcpTransport *>(arg)->queueEvent(TRANSPORT_EVENT_CONNECTED); },
                     this);

    client.onData([](void *arg, AsyncClient *c, void *data, size_t len)
                  { static_cast<AsyncTcpTransport *>(arg)->queueEvent(TRANSPORT_EVENT_DATA, (const char *)data, len); },
                  this);

    client.onDisconnect([](void *arg, AsyncClient *c)
                        { static_cast<AsyncTcpTransport *>(arg)->queueEvent(TRANSPORT_EVENT_CLOSED); },
                        this);

    client.onError([](void *arg, AsyncClient *c, int8_t error)
                   {
                       const char *text = c->errorToString(error);
                       static_cast<AsyncTcpTransport *>(arg)->queueEvent(TRANSPORT_EVENT_ERROR, text, strlen(text)); },
                   this);

    client.onTimeout([](void *arg, AsyncClient *c, uint32_t time)
                     { static_cast<AsyncTcpTransport *>(arg)->queueEvent(TRANSPORT_EVENT_TIMEOUT); },
                     this);
}

// -------------------------------------------------------------------------
// AsyncTCP task side
// -------------------------------------------------------------------------

void AsyncTcpTransport::queueEvent(TransportEventType type, const char *data, size_t length)
{
    if (xSemaphoreTake(eventLock, portMAX_DELAY) != pdTRUE)
    {
        return;
    }

    uint8_t newest = (queueHead + TRANSPORT_EVENT_QUEUE_SIZE - 1) % TRANSPORT_EVENT_QUEUE_SIZE;
    if (type == TRANSPORT_EVENT_DATA && queueHead != queueTail &&
        eventQueue[newest].type == TRANSPORT_EVENT_DATA && eventQueue[newest].generation == generation)
    {
        eventQueue[newest].payload.append(data, length);
        xSemaphoreGive(eventLock);
        return;
    }

    uint8_t nextHead = (queueHead + 1) % TRANSPORT_EVENT_QUEUE_SIZE;
    if (nextHead == queueTail)
    {
        // Queue is full - drop oldest event
        queueTail = (queueTail + 1) % TRANSPORT_EVENT_QUEUE_SIZE;
        droppedEvents++;
    }

    eventQueue[queueHead].type = type;
    eventQueue[queueHead].generation = generation;
    eventQueue[queueHead].payload.assign(data != nullptr ? data : "", data != nullptr ? length : 0);
    queueHead = nextHead;

    xSemaphoreGive(eventLock);
}

// -------------------------------------------------------------------------
// loop() side
// -------------------------------------------------------------------------

bool AsyncTcpTransport::getNextEvent(TransportEvent &event)
{
    if (xSemaphoreTake(eventLock, portMAX_DELAY) != pdTRUE)
    {
        return false;
    }

    bool available = queueTail != queueHead;
    if (available)
    {
        event.type = eventQueue[queueTail].type;
        event.generation = eventQueue[queueTail].generation;
        event.payload.swap(eventQueue[queueTail].payload);
        eventQueue[queueTail].payload.clear();
        queueTail = (queueTail + 1) % TRANSPORT_EVENT_QUEUE_SIZE;
    }

    xSemaphoreGive(eventLock);
    return available;
}

bool AsyncTcpTransport::connect(const std::string &host, uint16_t port)
{
    IPAddress address;
    if (!address.fromString(host.c_str()))
    {
        LOG_ERROR("Invalid PDU address: " + host);
        return false;
    }

    if (!client.disconnected())
    {
        client.close(true);
    }

    xSemaphoreTake(eventLock, portMAX_DELAY);
    generation++;
    lossReported = false;
    xSemaphoreGive(eventLock);
    linkUp = false;

    return client.connect(address, port);
}

void AsyncTcpTransport::disconnect()
{
    xSemaphoreTake(eventLock, portMAX_DELAY);
    generation++;
    lossReported = true;
    xSemaphoreGive(eventLock);
    linkUp = false;

    if (!client.disconnected())
    {
        client.close(true);
    }
}

bool AsyncTcpTransport::write(const std::string &data)
{
    if (!linkUp || !client.connected())
    {
        return false;
    }
    if (!client.canSend() || client.space() < data.size())
    {
        LOG_WARNING("TCP send buffer full, " + std::to_string(data.size()) + " bytes not written");
        return false;
    }
    return client.write(data.data(), data.size()) == data.size();
}

void AsyncTcpTransport::processEvents()
{
    TransportEvent event;
    while (getNextEvent(event))
    {
        if (event.generation != generation)
        {
            continue; // from a link we already dropped
        }

        switch (event.type)
        {
        case TRANSPORT_EVENT_CONNECTED:
            linkUp = true;
            if (listener)
            {
                listener->onTransportConnected();
            }
            break;

        case TRANSPORT_EVENT_DATA:
            if (linkUp && listener)
            {
                listener->onTransportData(event.payload.data(), event.payload.size());
            }
            break;

        case TRANSPORT_EVENT_CLOSED:
        case TRANSPORT_EVENT_ERROR:
        case TRANSPORT_EVENT_TIMEOUT:
            linkUp = false;
            // An error is normally followed by a close; report the loss once
            if (lossReported)
            {
                break;
            }
            lossReported = true;
            if (event.type == TRANSPORT_EVENT_TIMEOUT)
            {
                client.close(true);
            }
            if (listener)
            {
                if (event.type == TRANSPORT_EVENT_CLOSED)
                {
                    listener->onTransportClosed();
                }
                else if (event.type == TRANSPORT_EVENT_ERROR)
                {
                    listener->onTransportError(event.payload);
                }
                else
                {
                    listener->onTransportTimeout();
                }
            }
            break;
        }
    }

    xSemaphoreTake(eventLock, portMAX_DELAY);
    uint32_t dropped = droppedEvents;
    droppedEvents = 0;
    xSemaphoreGive(eventLock);

    if (dropped > 0)
    {
        LOG_WARNING("Transport event queue overflow - " + std::to_string(dropped) + " events dropped");
    }
}

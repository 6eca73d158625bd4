#pragma once

#include <Arduino.h>
#include <AsyncTCP.h>
#include <freertos/semphr.h>
#include <string>
#include "config.h"
#include "pdu_transport.h"

// -------------------------------------------------------------------------
// AsyncTCP Transport
// -------------------------------------------------------------------------
// AsyncClient callbacks run on the AsyncTCP task. They only record events
// here; processEvents() replays them into the session from loop().
// Consecutive data chunks are merged so a long listing never overflows
// the queue. Events carry the generation of the connection that produced
// them, so a late close from a link we already dropped is discarded.

enum TransportEventType
{
    TRANSPORT_EVENT_CONNECTED,
    TRANSPORT_EVENT_DATA,
    TRANSPORT_EVENT_CLOSED,
    TRANSPORT_EVENT_ERROR,
    TRANSPORT_EVENT_TIMEOUT
};

struct TransportEvent
{
    TransportEventType type;
    uint32_t generation;
    std::string payload; // data bytes or error text
};

class AsyncTcpTransport : public PduTransport
{
private:
    AsyncClient client;
    SemaphoreHandle_t eventLock;

    TransportEvent eventQueue[TRANSPORT_EVENT_QUEUE_SIZE];
    uint8_t queueHead = 0;
    uint8_t queueTail = 0;
    uint32_t droppedEvents = 0;

    volatile uint32_t generation = 0;
    bool linkUp = false;
    bool lossReported = true;

    void queueEvent(TransportEventType type, const char *data = nullptr, size_t length = 0);
    bool getNextEvent(TransportEvent &event);
    void attachCallbacks();

public:
    AsyncTcpTransport();
    ~AsyncTcpTransport();

    AsyncTcpTransport(const AsyncTcpTransport &) = delete;
    AsyncTcpTransport &operator=(const AsyncTcpTransport &) = delete;

    bool connect(const std::string &host, uint16_t port) override;
    void disconnect() override;
    bool isConnected() const override { return linkUp; }
    bool write(const std::string &data) override;

    // Replays queued AsyncTCP events into the listener; call from loop()
    void processEvents();
};

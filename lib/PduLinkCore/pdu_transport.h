#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

// -------------------------------------------------------------------------
// Transport seam
// -------------------------------------------------------------------------
// Reliable in-order byte stream with explicit lifecycle events. The device
// build drives it with AsyncTCP, the host tests with a scripted fake.
// Events must be delivered on the thread that runs the session.

class TransportListener
{
public:
    virtual ~TransportListener() {}

    virtual void onTransportConnected() = 0;
    virtual void onTransportData(const char *data, size_t length) = 0;
    virtual void onTransportClosed() = 0;
    virtual void onTransportError(const std::string &detail) = 0;
    virtual void onTransportTimeout() = 0;
};

class PduTransport
{
public:
    virtual ~PduTransport() {}

    // Starts an asynchronous connect; false if it could not even be initiated
    virtual bool connect(const std::string &host, uint16_t port) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual bool write(const std::string &data) = 0;

    void setListener(TransportListener *newListener) { listener = newListener; }

protected:
    TransportListener *listener = nullptr;
};

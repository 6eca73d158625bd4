#pragma once

#include <Arduino.h>
#include "async_tcp_transport.h"
#include "broadcast_channel.h"
#include "config.h"
#include "pdu_session.h"
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// PDU Session Management
// -------------------------------------------------------------------------
// One PduSession per endpoint slot, all sharing the loop-driven scheduler
// and the in-process broadcast channel. Everything here runs on the
// Arduino loop task.

class SessionManager
{
private:
    static TimerScheduler scheduler;
    static BroadcastChannel channel;
    static AsyncTcpTransport *transports[MAX_ENDPOINTS];
    static PduSession *sessions[MAX_ENDPOINTS];
    static bool initialized;

public:
    static void init();
    static void update();

    static PduSession *getSession(uint8_t slot);
    static BroadcastChannel &getChannel() { return channel; }
    static TimerScheduler &getScheduler() { return scheduler; }

    // Persists the endpoint and hands it to the running session
    static bool applyEndpoint(uint8_t slot, const SessionConfig &config, String &error);
    static void setMode(uint8_t slot, OperationMode mode);
};

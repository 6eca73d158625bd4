#pragma once

#include <stdint.h>
#include <string>
#include "config.h"

// -------------------------------------------------------------------------
// Per-endpoint configuration
// -------------------------------------------------------------------------

enum class ReceiverAction : uint8_t
{
    CYCLE = 0,
    POWER_ON = 1
};

struct SessionConfig
{
    std::string tag = "pdu1"; // log prefix and broadcast origin
    std::string host;
    uint16_t port = DEFAULT_PDU_PORT;
    std::string username;
    std::string password;
    std::string prompt = DEFAULT_PDU_PROMPT;
    bool connectOnStart = true;
    ReceiverAction receiverAction = ReceiverAction::CYCLE;

    bool hasHost() const { return !host.empty(); }
    bool validate(std::string &reason) const;

    static bool isValidIPv4(const std::string &address);
    static bool isValidPort(uint32_t port) { return port >= 1 && port <= 65535; }
    static const char *receiverActionToString(ReceiverAction action);
    static ReceiverAction receiverActionFromString(const std::string &value);
};

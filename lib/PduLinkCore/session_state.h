#pragma once

#include <stdint.h>
#include <string>

// -------------------------------------------------------------------------
// Session State
// -------------------------------------------------------------------------
// The "who is waiting for what" flags of one PDU session. They overlap on
// purpose (a response can be outstanding during a post-group cooldown), so
// they are independent booleans rather than one state enum.

enum class CommandKind : uint8_t
{
    NONE = 0,
    OUTLET_TOGGLE,
    GROUP_TOGGLE,
    OUTLET_CYCLE,
    GROUP_CYCLE
};

inline bool isGroupCommand(CommandKind kind)
{
    return kind == CommandKind::GROUP_TOGGLE || kind == CommandKind::GROUP_CYCLE;
}

inline bool isCycleCommand(CommandKind kind)
{
    return kind == CommandKind::OUTLET_CYCLE || kind == CommandKind::GROUP_CYCLE;
}

inline const char *commandKindToString(CommandKind kind)
{
    switch (kind)
    {
    case CommandKind::OUTLET_TOGGLE:
        return "outlet";
    case CommandKind::GROUP_TOGGLE:
        return "group";
    case CommandKind::OUTLET_CYCLE:
        return "cycle_outlet";
    case CommandKind::GROUP_CYCLE:
        return "cycle_group";
    default:
        return "none";
    }
}

struct SessionFlags
{
    bool connected = false;
    bool authenticated = false;
    bool stayConnected = false; // user wants the link up; drives auto-reconnect

    bool processing = false; // mirrors the processing indicator
    bool userInitiatedCommand = false;
    bool waitingForUserConfirmation = false;
    bool serverConfirmationPending = false;
    bool groupOperationInFlight = false;
    bool postGroupCooldown = false;
    bool revertingState = false;
};

// Snapshot taken right before a user command is sent, used only to revert
struct OperationRecord
{
    CommandKind kind = CommandKind::NONE;
    uint8_t index = 0;
    bool priorState = false;

    bool isValid() const { return kind != CommandKind::NONE && index != 0; }
    void clear() { *this = OperationRecord(); }
};

// The single armed-but-unexecuted user action
struct PendingUserCommand
{
    CommandKind kind = CommandKind::NONE;
    uint8_t index = 0;
    std::string text;
    bool intendedState = false;
    bool priorState = false;
    std::string description;
    uint32_t armedAtMs = 0;

    bool isArmed() const { return kind != CommandKind::NONE && !text.empty(); }
    void clear() { *this = PendingUserCommand(); }
};

enum class ErrorType : uint8_t
{
    NONE = 0,
    SOCKET_CLOSED,
    SOCKET_ERROR,
    SOCKET_TIMEOUT,
    CONNECTION_FAILED,
    AUTHENTICATION_FAILED,
    CONNECTION_LOST,
    COMMAND_REJECTED,
    WRITE_FAILED,
    COMMAND_TIMEOUT
};

inline const char *errorTypeToString(ErrorType type)
{
    switch (type)
    {
    case ErrorType::SOCKET_CLOSED:
        return "socket_closed";
    case ErrorType::SOCKET_ERROR:
        return "socket_error";
    case ErrorType::SOCKET_TIMEOUT:
        return "socket_timeout";
    case ErrorType::CONNECTION_FAILED:
        return "connection_failed";
    case ErrorType::AUTHENTICATION_FAILED:
        return "authentication_failed";
    case ErrorType::CONNECTION_LOST:
        return "connection_lost";
    case ErrorType::COMMAND_REJECTED:
        return "command_rejected";
    case ErrorType::WRITE_FAILED:
        return "write_failed";
    case ErrorType::COMMAND_TIMEOUT:
        return "command_timeout";
    default:
        return "none";
    }
}

struct PerformanceStats
{
    uint32_t commandsSent = 0;
    uint32_t responsesReceived = 0;
    uint32_t errors = 0;
    uint32_t lastResponseMs = 0;
    uint32_t lastReconnectMs = 0;
};

struct ErrorStats
{
    uint32_t connectionErrors = 0;
    uint32_t authenticationErrors = 0;
    uint32_t commandErrors = 0;
    uint32_t timeoutErrors = 0;
    uint32_t lastErrorMs = 0;
    ErrorType lastErrorType = ErrorType::NONE;

    void record(ErrorType type, uint32_t nowMs)
    {
        switch (type)
        {
        case ErrorType::SOCKET_CLOSED:
        case ErrorType::SOCKET_ERROR:
        case ErrorType::CONNECTION_FAILED:
            connectionErrors++;
            break;
        case ErrorType::AUTHENTICATION_FAILED:
            authenticationErrors++;
            break;
        case ErrorType::SOCKET_TIMEOUT:
        case ErrorType::COMMAND_TIMEOUT:
            timeoutErrors++;
            break;
        case ErrorType::CONNECTION_LOST:
        case ErrorType::COMMAND_REJECTED:
        case ErrorType::WRITE_FAILED:
            commandErrors++;
            break;
        default:
            return;
        }
        lastErrorMs = nowMs;
        lastErrorType = type;
    }

    uint32_t total() const { return connectionErrors + commandErrors + timeoutErrors; }
};

struct SessionHealth
{
    bool connected;
    bool authenticated;
    uint8_t reconnectAttempts;
    bool pollingActive;
    bool awaitingResponse;
    PerformanceStats performance;
    ErrorStats errors;
    SessionFlags flags;
};

#pragma once

#include <stdint.h>
#include <deque>
#include <functional>
#include <string>
#include <vector>
#include "config.h"
#include "pdu_transport.h"
#include "session_state.h"
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// Command Queue & Dispatcher
// -------------------------------------------------------------------------
// Responses carry no correlation id: the only way to know what a response
// answers is that exactly one command is outstanding when it arrives.
// Everything written to the PDU, except y/n replies and credentials, goes
// through processNext().

struct PduCommand
{
    std::string text;
    bool userInitiated = false;
    uint32_t timeoutMs = RESPONSE_TIMEOUT_MS;

    static PduCommand query(const std::string &text)
    {
        PduCommand command;
        command.text = text;
        return command;
    }

    static PduCommand user(const std::string &text, uint32_t timeoutMs = RESPONSE_TIMEOUT_MS)
    {
        PduCommand command;
        command.text = text;
        command.userInitiated = true;
        command.timeoutMs = timeoutMs;
        return command;
    }
};

class CommandQueue
{
public:
    typedef std::function<void(const PduCommand &command)> CommandCallback;

    CommandQueue(PduTransport &transport, TimerScheduler &scheduler,
                 PerformanceStats &performance, ErrorStats &errors);
    ~CommandQueue();

    void setTag(const std::string &newTag) { tag = newTag; }

    // Not connected at send time (reconnect hook for user commands)
    void setConnectionLostCallback(CommandCallback callback) { onConnectionLost = callback; }
    // Response never arrived and the retry policy gave up
    void setRetriesExhaustedCallback(CommandCallback callback) { onRetriesExhausted = callback; }

    void enqueue(const std::vector<PduCommand> &commands); // replaces the queue
    void push(const PduCommand &command);
    // Drops queued polls; command goes next after any queued user commands
    void submitPriority(const PduCommand &command);

    // No-op while a response is outstanding or nothing is queued
    bool processNext();

    // The prompt for the outstanding command has arrived
    void completeResponse();

    bool sendReply(const std::string &reply);
    bool sendCredential(const std::string &credential);

    // Stops the response timer while a server confirmation waits on the user
    void suspendTimeout();

    void clear();

    bool isAwaitingResponse() const { return awaiting; }
    const PduCommand &getOutstanding() const { return outstanding; }
    size_t size() const { return pending.size(); }
    const std::deque<PduCommand> &getPending() const { return pending; }
    uint8_t getRetryCount() const { return retryCount; }

    static bool isSafeCommandText(const std::string &text);

private:
    PduTransport &transport;
    TimerScheduler &scheduler;
    PerformanceStats &performance;
    ErrorStats &errors;
    std::string tag;

    std::deque<PduCommand> pending;
    PduCommand outstanding;
    bool awaiting = false;

    uint8_t retryCount = 0;
    uint32_t firstSentMs = 0;
    TimerId responseTimer = NO_TIMER;
    TimerId retryTimer = NO_TIMER;

    CommandCallback onConnectionLost;
    CommandCallback onRetriesExhausted;

    bool dispatch(const PduCommand &command);
    bool writeLine(const std::string &line);
    void recordCommandError(ErrorType type);
    void startResponseTimer();
    void stopTimers();
    void handleResponseTimeout();
    void resend();
    void abandonOutstanding();
    std::string prefix() const { return "[" + tag + "] "; }
};

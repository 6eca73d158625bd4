#include "command_queue.h"
#include "logger.h"
#include <ctype.h>

CommandQueue::CommandQueue(PduTransport &transport, TimerScheduler &scheduler,
                           PerformanceStats &performance, ErrorStats &errors)
    : transport(transport), scheduler(scheduler), performance(performance), errors(errors), tag("pdu")
{
}

CommandQueue::~CommandQueue()
{
    stopTimers();
}

bool CommandQueue::isSafeCommandText(const std::string &text)
{
    if (text.empty())
    {
        return false;
    }
    for (size_t i = 0; i < text.size(); i++)
    {
        unsigned char c = (unsigned char)text[i];
        if (!isalnum(c) && !isspace(c) && c != '-' && c != '.' && c != ':')
        {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Queueing
// ---------------------------------------------------------------------------

void CommandQueue::enqueue(const std::vector<PduCommand> &commands)
{
    pending.assign(commands.begin(), commands.end());
}

void CommandQueue::push(const PduCommand &command)
{
    pending.push_back(command);
}

void CommandQueue::submitPriority(const PduCommand &command)
{
    // Queued polls give way; user commands already waiting keep their turn
    std::deque<PduCommand> kept;
    for (const auto &queued : pending)
    {
        if (queued.userInitiated)
        {
            kept.push_back(queued);
        }
    }
    if (kept.size() != pending.size())
    {
        LOG_DEBUG(prefix() + "Dropping " + std::to_string(pending.size() - kept.size()) +
                  " queued poll(s) for: " + command.text);
    }
    if (!kept.empty())
    {
        LOG_INFO(prefix() + "Queued behind " + std::to_string(kept.size()) + " user command(s): " + command.text);
    }
    kept.push_back(command);
    pending.swap(kept);
}

bool CommandQueue::processNext()
{
    while (!awaiting && !pending.empty())
    {
        PduCommand command = pending.front();
        pending.pop_front();

        if (dispatch(command))
        {
            return true;
        }

        // Without a connection nothing behind it can be sent either
        if (!transport.isConnected())
        {
            pending.clear();
            return false;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Sending
// ---------------------------------------------------------------------------

void CommandQueue::recordCommandError(ErrorType type)
{
    performance.errors++;
    errors.record(type, scheduler.now());
}

bool CommandQueue::writeLine(const std::string &line)
{
    if (!transport.write(line + LINE_TERMINATOR))
    {
        recordCommandError(ErrorType::WRITE_FAILED);
        return false;
    }
    performance.commandsSent++;
    return true;
}

bool CommandQueue::dispatch(const PduCommand &command)
{
    if (!isSafeCommandText(command.text))
    {
        LOG_ERROR(prefix() + "PDU command contains invalid characters: " + Logger::formatRaw(command.text));
        recordCommandError(ErrorType::COMMAND_REJECTED);
        return false;
    }

    if (!transport.isConnected())
    {
        LOG_ERROR(prefix() + "Socket not connected - cannot send command: " + command.text);
        recordCommandError(ErrorType::CONNECTION_LOST);
        if (command.userInitiated && onConnectionLost)
        {
            LOG_INFO(prefix() + "Connection lost during user command - attempting reconnection");
            onConnectionLost(command);
        }
        return false;
    }

    LOG_INFO(prefix() + "Sending command: " + command.text);
    if (!writeLine(command.text))
    {
        LOG_ERROR(prefix() + "Failed to send command: " + command.text);
        return false;
    }

    outstanding = command;
    awaiting = true;
    retryCount = 0;
    firstSentMs = scheduler.now();
    startResponseTimer();
    return true;
}

bool CommandQueue::sendReply(const std::string &reply)
{
    if (!isSafeCommandText(reply))
    {
        recordCommandError(ErrorType::COMMAND_REJECTED);
        return false;
    }
    if (!transport.isConnected())
    {
        LOG_ERROR(prefix() + "Socket not connected - cannot send reply: " + reply);
        recordCommandError(ErrorType::CONNECTION_LOST);
        return false;
    }

    LOG_DEBUG(prefix() + "Sending reply: " + reply);
    if (!writeLine(reply))
    {
        return false;
    }

    // The server answered, so the outstanding command gets a fresh window
    if (awaiting)
    {
        startResponseTimer();
    }
    return true;
}

bool CommandQueue::sendCredential(const std::string &credential)
{
    if (!transport.isConnected())
    {
        LOG_ERROR(prefix() + "Socket not connected - cannot send credential");
        recordCommandError(ErrorType::CONNECTION_LOST);
        return false;
    }

    LOG_DEBUG(prefix() + "Sending credential: " + std::string(credential.size(), '*'));
    return writeLine(credential);
}

// ---------------------------------------------------------------------------
// Response tracking and retry
// ---------------------------------------------------------------------------

void CommandQueue::completeResponse()
{
    stopTimers();
    awaiting = false;
    retryCount = 0;
    outstanding = PduCommand();
}

void CommandQueue::startResponseTimer()
{
    scheduler.cancel(responseTimer);
    uint32_t timeoutMs = outstanding.timeoutMs > 0 ? outstanding.timeoutMs : RESPONSE_TIMEOUT_MS;
    responseTimer = scheduler.schedule(timeoutMs, [this]()
                                       {
                                           responseTimer = NO_TIMER;
                                           handleResponseTimeout(); },
                                       "response-timeout");
}

void CommandQueue::suspendTimeout()
{
    scheduler.cancel(responseTimer);
    responseTimer = NO_TIMER;
}

void CommandQueue::stopTimers()
{
    scheduler.cancel(responseTimer);
    scheduler.cancel(retryTimer);
    responseTimer = NO_TIMER;
    retryTimer = NO_TIMER;
}

void CommandQueue::handleResponseTimeout()
{
    if (!awaiting)
    {
        return;
    }

    LOG_INFO(prefix() + "Command timeout - attempting retry: " + outstanding.text);
    errors.record(ErrorType::COMMAND_TIMEOUT, scheduler.now());

    uint32_t elapsed = scheduler.now() - firstSentMs;
    if (elapsed > COMMAND_RETRY_BUDGET_MS)
    {
        LOG_WARNING(prefix() + "Retry timeout reached (" + std::to_string(COMMAND_RETRY_BUDGET_MS / 1000) +
                    " seconds), forcing cleanup");
        abandonOutstanding();
        return;
    }

    if (retryCount >= COMMAND_RETRY_ATTEMPTS)
    {
        LOG_WARNING(prefix() + "Max retry attempts reached, clearing retry state");
        abandonOutstanding();
        return;
    }

    retryCount++;
    LOG_INFO(prefix() + "Retrying command (attempt " + std::to_string(retryCount) + "/" +
             std::to_string(COMMAND_RETRY_ATTEMPTS) + "): " + outstanding.text);

    retryTimer = scheduler.schedule(COMMAND_RETRY_DELAY_MS, [this]()
                                    {
                                        retryTimer = NO_TIMER;
                                        resend(); },
                                    "command-retry");
}

void CommandQueue::resend()
{
    if (!awaiting)
    {
        return;
    }

    if (!transport.isConnected())
    {
        LOG_WARNING(prefix() + "Connection gone before retry of: " + outstanding.text);
        recordCommandError(ErrorType::CONNECTION_LOST);
        abandonOutstanding();
        return;
    }

    if (!writeLine(outstanding.text))
    {
        abandonOutstanding();
        return;
    }
    startResponseTimer();
}

void CommandQueue::abandonOutstanding()
{
    PduCommand failed = outstanding;
    stopTimers();
    awaiting = false;
    retryCount = 0;
    outstanding = PduCommand();

    if (onRetriesExhausted)
    {
        onRetriesExhausted(failed);
    }
}

void CommandQueue::clear()
{
    stopTimers();
    pending.clear();
    awaiting = false;
    retryCount = 0;
    outstanding = PduCommand();
}

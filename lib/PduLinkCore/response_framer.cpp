#include "response_framer.h"
#include "logger.h"

ResponseFramer::ResponseFramer(const std::string &prompt, size_t capacity)
    : prompt(prompt), capacity(capacity)
{
    buffer.reserve(capacity < 1024 ? capacity : 1024);
}

bool ResponseFramer::append(const char *data, size_t length)
{
    bool accepted = true;

    if (buffer.size() > capacity)
    {
        LOG_WARNING("Response buffer overflow (" + std::to_string(buffer.size()) + " bytes), clearing buffer");
        buffer.clear();
        dropCount++;
        accepted = false;
    }

    if (length > capacity)
    {
        LOG_ERROR("Received oversized data chunk (" + std::to_string(length) + " bytes), discarding");
        dropCount++;
        return false;
    }

    if (data != nullptr && length > 0)
    {
        buffer.append(data, length);
    }
    return accepted;
}

FrameKind ResponseFramer::detect(bool authenticated) const
{
    if (buffer.empty())
    {
        return FrameKind::NONE;
    }

    if (!authenticated)
    {
        if (contains(MARKER_USERNAME))
            return FrameKind::USERNAME;
        if (contains(MARKER_PASSWORD))
            return FrameKind::PASSWORD;
        if (contains(MARKER_WELCOME))
            return FrameKind::WELCOME;
        if (contains(MARKER_AUTH_FAILED))
            return FrameKind::AUTH_FAILED;
        return FrameKind::NONE;
    }

    if (contains(MARKER_CONFIRM))
        return FrameKind::CONFIRM_PROMPT;

    // A prompt split across chunks is simply not found yet
    if (!prompt.empty() && buffer.find(prompt) != std::string::npos)
        return FrameKind::RESPONSE;

    return FrameKind::NONE;
}

const char *ResponseFramer::frameKindToString(FrameKind kind)
{
    switch (kind)
    {
    case FrameKind::NONE:
        return "NONE";
    case FrameKind::CONFIRM_PROMPT:
        return "CONFIRM_PROMPT";
    case FrameKind::USERNAME:
        return "USERNAME";
    case FrameKind::PASSWORD:
        return "PASSWORD";
    case FrameKind::WELCOME:
        return "WELCOME";
    case FrameKind::AUTH_FAILED:
        return "AUTH_FAILED";
    case FrameKind::RESPONSE:
        return "RESPONSE";
    default:
        return "UNKNOWN";
    }
}

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>
#include "config.h"

// -------------------------------------------------------------------------
// Response Framer
// -------------------------------------------------------------------------
// The CLI has no message framing. Data accumulates here until one of the
// known markers is fully present; the session then acts and clears.

enum class FrameKind : uint8_t
{
    NONE = 0,       // keep accumulating
    CONFIRM_PROMPT, // "Do you wish to continue? [y/n]"
    USERNAME,
    PASSWORD,
    WELCOME,
    AUTH_FAILED,
    RESPONSE // complete output terminated by the shell prompt
};

class ResponseFramer
{
public:
    explicit ResponseFramer(const std::string &prompt = DEFAULT_PDU_PROMPT,
                            size_t capacity = RESPONSE_BUFFER_SIZE);

    // Returns false when the chunk (or the stale buffer) had to be dropped
    bool append(const char *data, size_t length);
    bool append(const std::string &data) { return append(data.data(), data.size()); }

    // Login markers are only looked for before authentication, the
    // confirmation prompt and the shell prompt only after it.
    FrameKind detect(bool authenticated) const;

    void clear() { buffer.clear(); }
    const std::string &contents() const { return buffer; }
    size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    void setPrompt(const std::string &newPrompt) { prompt = newPrompt; }
    const std::string &getPrompt() const { return prompt; }
    size_t getCapacity() const { return capacity; }
    uint32_t getDropCount() const { return dropCount; }

    static const char *frameKindToString(FrameKind kind);

private:
    std::string buffer;
    std::string prompt;
    size_t capacity;
    uint32_t dropCount = 0;

    bool contains(const char *marker) const { return buffer.find(marker) != std::string::npos; }
};

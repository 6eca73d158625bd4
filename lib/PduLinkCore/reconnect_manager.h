#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include "config.h"
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// Reconnection Manager
// -------------------------------------------------------------------------
// delay(n) = min(base * 2^n, max) + jitter, for n = attempts made so far.
// After maxAttempts the manager refuses to schedule until reset().

class ReconnectManager
{
public:
    typedef std::function<uint32_t(uint32_t limitMs)> JitterSource; // [0, limitMs)
    typedef std::function<void()> Callback;

    explicit ReconnectManager(TimerScheduler &scheduler,
                              uint8_t maxAttempts = MAX_RECONNECT_ATTEMPTS,
                              uint32_t baseDelayMs = RECONNECT_BASE_DELAY_MS,
                              uint32_t maxDelayMs = RECONNECT_MAX_DELAY_MS,
                              uint32_t jitterMs = RECONNECT_JITTER_MS);
    ~ReconnectManager();

    void setTag(const std::string &newTag) { tag = newTag; }
    void setJitterSource(JitterSource source) { jitterSource = source; }
    void setAttemptCallback(Callback callback) { onAttempt = callback; }
    void setExhaustedCallback(Callback callback) { onExhausted = callback; }

    // Returns true if an attempt is (already) scheduled
    bool schedule();
    void cancel();
    void reset();

    uint32_t backoffDelay(uint8_t attempt) const;

    uint8_t getAttempts() const { return attempts; }
    bool isPending() const { return attemptTimer != NO_TIMER; }
    bool isExhausted() const { return attempts >= maxAttempts; }
    uint32_t getLastDelay() const { return lastDelayMs; }
    uint32_t getLastAttemptMs() const { return lastAttemptMs; }

private:
    TimerScheduler &scheduler;
    uint8_t maxAttempts;
    uint32_t baseDelayMs;
    uint32_t maxDelayMs;
    uint32_t jitterMs;
    std::string tag = "pdu";

    JitterSource jitterSource;
    Callback onAttempt;
    Callback onExhausted;

    uint8_t attempts = 0;
    uint32_t lastDelayMs = 0;
    uint32_t lastAttemptMs = 0;
    TimerId attemptTimer = NO_TIMER;

    std::string prefix() const { return "[" + tag + "] "; }
};

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <vector>
#include "config.h"

// -------------------------------------------------------------------------
// Cooperative one-shot timers
// -------------------------------------------------------------------------
// All callbacks run from update(), on the caller's thread. Nothing here
// blocks; a delay is only a due time compared against the last update().

typedef uint32_t TimerId;
typedef std::function<void()> TimerCallback;

static constexpr TimerId NO_TIMER = 0;

class TimerScheduler
{
public:
    explicit TimerScheduler(size_t maxTimers = MAX_ACTIVE_TIMERS);

    TimerId schedule(uint32_t delayMs, TimerCallback callback, const char *label = "timer");
    bool cancel(TimerId id);
    void cancelAll();
    bool isActive(TimerId id) const;

    // Fires every timer whose due time has been reached, oldest due first
    void update(uint32_t nowMs);

    uint32_t now() const { return nowMs; }
    size_t activeCount() const { return timers.size(); }
    uint32_t evictedCount() const { return evicted; }

private:
    struct Timer
    {
        TimerId id;
        uint32_t dueMs;
        TimerCallback callback;
        const char *label;
    };

    std::vector<Timer> timers; // creation order, front is oldest
    size_t maxTimers;
    uint32_t nowMs = 0;
    TimerId nextId = 1;
    uint32_t evicted = 0;

    static bool isDue(uint32_t dueMs, uint32_t nowMs) { return (int32_t)(nowMs - dueMs) >= 0; }
    bool findNextDue(size_t &index) const;
};

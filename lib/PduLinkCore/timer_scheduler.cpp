#include "timer_scheduler.h"
#include "logger.h"
#include <utility>

TimerScheduler::TimerScheduler(size_t maxTimers)
    : maxTimers(maxTimers == 0 ? 1 : maxTimers)
{
}

TimerId TimerScheduler::schedule(uint32_t delayMs, TimerCallback callback, const char *label)
{
    if (!callback)
    {
        return NO_TIMER;
    }

    // Hard cap: evict the oldest timer rather than grow without bound
    if (timers.size() >= maxTimers)
    {
        LOG_WARNING("Too many active timers (" + std::to_string(timers.size()) +
                    "), dropping oldest: " + std::string(timers.front().label));
        timers.erase(timers.begin());
        evicted++;
    }

    TimerId id = nextId++;
    if (nextId == NO_TIMER)
    {
        nextId = 1;
    }

    timers.push_back(Timer{id, nowMs + delayMs, std::move(callback), label});
    return id;
}

bool TimerScheduler::cancel(TimerId id)
{
    if (id == NO_TIMER)
    {
        return false;
    }

    for (auto it = timers.begin(); it != timers.end(); ++it)
    {
        if (it->id == id)
        {
            timers.erase(it);
            return true;
        }
    }
    return false;
}

void TimerScheduler::cancelAll()
{
    timers.clear();
}

bool TimerScheduler::isActive(TimerId id) const
{
    if (id == NO_TIMER)
    {
        return false;
    }

    for (const auto &timer : timers)
    {
        if (timer.id == id)
        {
            return true;
        }
    }
    return false;
}

bool TimerScheduler::findNextDue(size_t &index) const
{
    bool found = false;
    for (size_t i = 0; i < timers.size(); i++)
    {
        if (!isDue(timers[i].dueMs, nowMs))
        {
            continue;
        }
        if (!found || (int32_t)(timers[i].dueMs - timers[index].dueMs) < 0)
        {
            index = i;
            found = true;
        }
    }
    return found;
}

void TimerScheduler::update(uint32_t currentMs)
{
    nowMs = currentMs;

    size_t index = 0;
    while (findNextDue(index))
    {
        // Remove before running: the callback may schedule or cancel freely
        TimerCallback callback = std::move(timers[index].callback);
        timers.erase(timers.begin() + index);
        callback();
    }
}

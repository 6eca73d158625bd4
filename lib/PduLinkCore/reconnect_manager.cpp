#include "reconnect_manager.h"
#include "logger.h"
#include <stdio.h>
#include <stdlib.h>

ReconnectManager::ReconnectManager(TimerScheduler &scheduler, uint8_t maxAttempts,
                                   uint32_t baseDelayMs, uint32_t maxDelayMs, uint32_t jitterMs)
    : scheduler(scheduler), maxAttempts(maxAttempts), baseDelayMs(baseDelayMs),
      maxDelayMs(maxDelayMs), jitterMs(jitterMs)
{
    jitterSource = [](uint32_t limitMs) -> uint32_t
    {
        return limitMs == 0 ? 0 : (uint32_t)rand() % limitMs;
    };
}

ReconnectManager::~ReconnectManager()
{
    cancel();
}

uint32_t ReconnectManager::backoffDelay(uint8_t attempt) const
{
    uint64_t delay = baseDelayMs;
    for (uint8_t i = 0; i < attempt && delay < maxDelayMs; i++)
    {
        delay *= 2;
    }
    return delay > maxDelayMs ? maxDelayMs : (uint32_t)delay;
}

bool ReconnectManager::schedule()
{
    if (attemptTimer != NO_TIMER)
    {
        return true;
    }

    if (attempts >= maxAttempts)
    {
        LOG_WARNING(prefix() + "Maximum reconnection attempts reached (" + std::to_string(maxAttempts) +
                    "). Manual intervention required.");
        if (onExhausted)
        {
            onExhausted();
        }
        return false;
    }

    uint32_t delay = backoffDelay(attempts);
    if (jitterSource && jitterMs > 0)
    {
        delay += jitterSource(jitterMs);
    }

    attempts++;
    lastDelayMs = delay;
    lastAttemptMs = scheduler.now();

    char seconds[16];
    snprintf(seconds, sizeof(seconds), "%.1f", delay / 1000.0);
    LOG_INFO(prefix() + "Attempting reconnection #" + std::to_string(attempts) + " in " + seconds + " seconds...");

    attemptTimer = scheduler.schedule(delay, [this]()
                                      {
                                          attemptTimer = NO_TIMER;
                                          if (onAttempt)
                                          {
                                              onAttempt();
                                          } },
                                      "reconnect");
    return true;
}

void ReconnectManager::cancel()
{
    scheduler.cancel(attemptTimer);
    attemptTimer = NO_TIMER;
}

void ReconnectManager::reset()
{
    if (attempts > 0)
    {
        LOG_DEBUG(prefix() + "Reconnection attempts reset after successful connection");
    }
    cancel();
    attempts = 0;
    lastDelayMs = 0;
    lastAttemptMs = 0;
}

#include "poller.h"
#include "logger.h"

Poller::Poller(TimerScheduler &scheduler, uint32_t intervalMs)
    : scheduler(scheduler), intervalMs(intervalMs)
{
}

Poller::~Poller()
{
    stop();
}

std::vector<PduCommand> Poller::buildBatch(bool includeOutlets)
{
    std::vector<PduCommand> batch;
    batch.push_back(PduCommand::query("show inlets"));
    batch.push_back(PduCommand::query("show sensor externalsensor 1"));
    batch.push_back(PduCommand::query("show sensor externalsensor 2"));
    batch.push_back(PduCommand::query("show sensor inlet I1 activePower"));
    if (includeOutlets)
    {
        batch.push_back(PduCommand::query("show outlets"));
    }
    batch.push_back(PduCommand::query("show outletgroups"));
    return batch;
}

void Poller::scheduleNext(uint32_t delayMs)
{
    scheduler.cancel(pollTimer);
    pollTimer = scheduler.schedule(delayMs, [this]()
                                   {
                                       pollTimer = NO_TIMER;
                                       pollNow(); },
                                   "poll");
}

void Poller::startAfter(uint32_t delayMs)
{
    skipCount = 0;
    scheduleNext(delayMs);
}

bool Poller::restart()
{
    if (isBusy && isBusy())
    {
        LOG_DEBUG(prefix() + "Skipping poll restart - system busy");
        return false;
    }
    skipCount = 0;
    return pollNow();
}

void Poller::stop()
{
    scheduler.cancel(pollTimer);
    pollTimer = NO_TIMER;
    skipCount = 0;
}

bool Poller::pollNow()
{
    if (skipCount >= MAX_POLL_SKIPS)
    {
        LOG_ERROR(prefix() + "Too many poll failures (" + std::to_string(skipCount) + "), stopping polling");
        stop();
        return false;
    }

    if (isBusy && isBusy())
    {
        skipCount++;
        LOG_DEBUG(prefix() + "Skipping poll - system busy (" + std::to_string(skipCount) + ")");
        scheduleNext(intervalMs);
        return false;
    }

    skipCount = 0;

    bool includeOutlets = !(isOutletQuerySuppressed && isOutletQuerySuppressed());
    if (!includeOutlets)
    {
        LOG_DEBUG(prefix() + "Group operation or post-group period - skipping individual outlet queries");
    }

    LOG_INFO(prefix() + "Polling PDU for data...");
    batchCount++;
    if (batchSink)
    {
        batchSink(buildBatch(includeOutlets));
    }

    scheduleNext(intervalMs);
    return true;
}

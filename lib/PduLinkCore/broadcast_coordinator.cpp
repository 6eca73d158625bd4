#include "broadcast_coordinator.h"
#include "logger.h"
#include "text_scanner.h"

BroadcastCoordinator::BroadcastCoordinator(BroadcastChannel &channel, TimerScheduler &scheduler,
                                           const std::string &originId)
    : channel(channel), scheduler(scheduler), originId(originId)
{
    subscription = channel.subscribe([this](const BroadcastMessage &message)
                                     { onMessage(message); });
}

BroadcastCoordinator::~BroadcastCoordinator()
{
    stopTimers();
    channel.unsubscribe(subscription);
}

void BroadcastCoordinator::stopTimers()
{
    scheduler.cancel(settleTimer);
    scheduler.cancel(releaseTimer);
    settleTimer = NO_TIMER;
    releaseTimer = NO_TIMER;
}

void BroadcastCoordinator::initiate(uint8_t groupIndex, const std::string &groupName)
{
    stopTimers();

    intent.groupName = groupName;
    intent.initiatedLocally = true;
    intent.issuedAtMs = scheduler.now();

    pendingCycleGroup = groupIndex;
    receiver = false;
    receiverGroup = 0;
    cancelled = false;
    processing = true;

    lastBroadcastName = groupName;
    lastBroadcastMs = scheduler.now();
    hasLastBroadcast = true;

    LOG_INFO(prefix() + "Broadcasting cycle for group: " + groupName);

    BroadcastMessage message;
    message.groupName = groupName;
    message.originId = originId;
    channel.publish(message);
}

void BroadcastCoordinator::cancelIntent()
{
    if (!processing || !intent.initiatedLocally || intent.groupName.empty())
    {
        return;
    }

    LOG_INFO(prefix() + "Cancelling broadcast for group: " + intent.groupName);

    BroadcastMessage message;
    message.groupName = intent.groupName;
    message.originId = originId;
    message.cancel = true;
    channel.publish(message);
}

void BroadcastCoordinator::complete()
{
    if (processing)
    {
        LOG_DEBUG(prefix() + "Broadcast operation complete for group: " + intent.groupName);
    }
    stopTimers();
    intent = BroadcastIntent();
    processing = false;
    receiver = false;
    cancelled = false;
    deferring = false;
    pendingCycleGroup = 0;
    receiverGroup = 0;
    settleGroup = 0;
}

void BroadcastCoordinator::reset()
{
    complete();
    lastBroadcastName.clear();
    lastBroadcastMs = 0;
    hasLastBroadcast = false;
}

void BroadcastCoordinator::release()
{
    stopTimers();
    processing = false;
    deferring = false;
    settleGroup = 0;
    if (!intent.initiatedLocally)
    {
        intent = BroadcastIntent();
    }
}

void BroadcastCoordinator::onMessage(const BroadcastMessage &message)
{
    if (message.originId == originId || message.groupName.empty())
    {
        return;
    }

    if (message.cancel)
    {
        if (processing && TextScanner::toLower(message.groupName) == TextScanner::toLower(intent.groupName))
        {
            LOG_INFO(prefix() + "Broadcast cancelled for group: " + message.groupName);
            cancelled = true;
        }
        return;
    }

    uint32_t now = scheduler.now();
    if (hasLastBroadcast && message.groupName == lastBroadcastName && now - lastBroadcastMs < BROADCAST_COOLDOWN_MS)
    {
        LOG_DEBUG(prefix() + "Ignoring repeated broadcast for group: " + message.groupName);
        return;
    }

    if (processing)
    {
        LOG_DEBUG(prefix() + "Broadcast already in progress - ignoring group: " + message.groupName);
        return;
    }

    lastBroadcastName = message.groupName;
    lastBroadcastMs = now;
    hasLastBroadcast = true;
    processing = true;
    cancelled = false;
    deferring = false;

    intent.groupName = message.groupName;
    intent.initiatedLocally = false;
    intent.issuedAtMs = now;

    LOG_INFO(prefix() + "Processing broadcast for group: " + message.groupName);

    uint8_t groupIndex = groupLookup ? groupLookup(message.groupName) : 0;
    if (groupIndex == 0)
    {
        LOG_INFO(prefix() + "No matching group found for name: " + message.groupName);
        releaseTimer = scheduler.schedule(BROADCAST_NO_MATCH_RELEASE_MS, [this]()
                                          {
                                              releaseTimer = NO_TIMER;
                                              release(); },
                                          "broadcast-release");
        return;
    }

    if (pendingCycleGroup == groupIndex)
    {
        // Already cycling this group ourselves
        release();
        return;
    }

    settleGroup = groupIndex;
    scheduleSettleCheck();
}

void BroadcastCoordinator::scheduleSettleCheck()
{
    settleTimer = scheduler.schedule(BROADCAST_CHECK_INTERVAL_MS, [this]()
                                     {
                                         settleTimer = NO_TIMER;
                                         checkSettle(); },
                                     "broadcast-settle");
}

void BroadcastCoordinator::checkSettle()
{
    if (cancelled)
    {
        LOG_INFO(prefix() + "Broadcast cancelled, aborting receiver operation");
        complete();
        if (onAbort)
        {
            onAbort();
        }
        return;
    }

    uint32_t elapsed = scheduler.now() - intent.issuedAtMs;
    if (elapsed < BROADCAST_SETTLE_MS)
    {
        scheduleSettleCheck();
        return;
    }

    if (deferCheck && deferCheck())
    {
        if (elapsed >= BROADCAST_DEFER_LIMIT_MS)
        {
            LOG_WARNING(prefix() + "Local command still in progress, dropping broadcast for group: " + intent.groupName);
            release();
            return;
        }
        if (!deferring)
        {
            LOG_INFO(prefix() + "Local command in progress, deferring broadcast action for group: " + intent.groupName);
            deferring = true;
        }
        scheduleSettleCheck();
        return;
    }
    deferring = false;

    uint8_t groupIndex = settleGroup;
    settleGroup = 0;
    receiver = true;
    receiverGroup = groupIndex;

    if (!receiverAction || !receiverAction(groupIndex))
    {
        LOG_WARNING(prefix() + "Receiver action failed for group " + std::to_string(groupIndex));
        receiver = false;
        receiverGroup = 0;
        release();
    }
}

#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include "broadcast_channel.h"
#include "config.h"
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// Broadcast Coordinator
// -------------------------------------------------------------------------
// Synchronised group cycle across sessions that share a group name.
//
// Initiator: records the group it is cycling (pendingCycleGroup), publishes
// the group name and sends its own command.
// Receiver: any other session with a local group of that name waits out a
// settle window, watching for a cancel, then runs its receiver action.
// While the defer check reports local user work in hand, the action waits
// on further settle ticks, up to BROADCAST_DEFER_LIMIT_MS after the intent.
// A repeat of the same name inside the cooldown is ignored.

struct BroadcastIntent
{
    std::string groupName;
    bool initiatedLocally = false;
    uint32_t issuedAtMs = 0;
};

class BroadcastCoordinator
{
public:
    typedef std::function<uint8_t(const std::string &groupName)> GroupLookup; // 0 when absent
    typedef std::function<bool(uint8_t groupIndex)> ReceiverAction;
    typedef std::function<void()> AbortCallback;
    typedef std::function<bool()> DeferCheck;

    BroadcastCoordinator(BroadcastChannel &channel, TimerScheduler &scheduler, const std::string &originId);
    ~BroadcastCoordinator();

    BroadcastCoordinator(const BroadcastCoordinator &) = delete;
    BroadcastCoordinator &operator=(const BroadcastCoordinator &) = delete;

    void setGroupLookup(GroupLookup lookup) { groupLookup = lookup; }
    void setReceiverAction(ReceiverAction action) { receiverAction = action; }
    void setAbortCallback(AbortCallback callback) { onAbort = callback; }
    void setDeferCheck(DeferCheck check) { deferCheck = check; }

    void initiate(uint8_t groupIndex, const std::string &groupName);
    // Publishes a cancel for a locally initiated intent still in progress
    void cancelIntent();
    // The group operation this broadcast drove has completed
    void complete();
    void reset();

    bool isProcessing() const { return processing; }
    bool isReceiver() const { return receiver; }
    uint8_t getPendingCycleGroup() const { return pendingCycleGroup; }
    uint8_t getReceiverGroup() const { return receiverGroup; }
    const BroadcastIntent &getIntent() const { return intent; }
    const std::string &getOriginId() const { return originId; }

private:
    BroadcastChannel &channel;
    TimerScheduler &scheduler;
    std::string originId;
    BroadcastChannel::SubscriptionId subscription;

    GroupLookup groupLookup;
    ReceiverAction receiverAction;
    AbortCallback onAbort;
    DeferCheck deferCheck;

    BroadcastIntent intent;
    bool processing = false;
    bool receiver = false;
    bool cancelled = false;
    bool deferring = false;
    uint8_t pendingCycleGroup = 0;
    uint8_t receiverGroup = 0;
    uint8_t settleGroup = 0;

    std::string lastBroadcastName;
    uint32_t lastBroadcastMs = 0;
    bool hasLastBroadcast = false;

    TimerId settleTimer = NO_TIMER;
    TimerId releaseTimer = NO_TIMER;

    void onMessage(const BroadcastMessage &message);
    void checkSettle();
    void scheduleSettleCheck();
    void release();
    void stopTimers();
    std::string prefix() const { return "[" + originId + "] "; }
};

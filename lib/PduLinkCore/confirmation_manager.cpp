#include "confirmation_manager.h"
#include "config.h"
#include "logger.h"

ConfirmationManager::ConfirmationManager(SessionFlags &flags, ControlPanel &panel, TimerScheduler &scheduler)
    : flags(flags), panel(panel), scheduler(scheduler)
{
}

ConfirmationManager::~ConfirmationManager()
{
    stopArmingTimers();
    scheduler.cancel(serverTimer);
}

void ConfirmationManager::revertArmedToggle()
{
    // Cycles never flip a toggle, so there is nothing to put back
    switch (pending.kind)
    {
    case CommandKind::OUTLET_TOGGLE:
        panel.setOutletState(pending.index, pending.priorState);
        break;
    case CommandKind::GROUP_TOGGLE:
        panel.setGroupState(pending.index, pending.priorState);
        break;
    default:
        break;
    }
}

void ConfirmationManager::stopArmingTimers()
{
    scheduler.cancel(armedTimer);
    scheduler.cancel(safetyTimer);
    armedTimer = NO_TIMER;
    safetyTimer = NO_TIMER;
}

bool ConfirmationManager::canPrepare(bool connected) const
{
    if (!connected)
    {
        LOG_ERROR(prefix() + "TCP connection not available. Cannot prepare command.");
        return false;
    }
    if (flags.serverConfirmationPending)
    {
        LOG_WARNING(prefix() + "PDU confirmation pending - cannot prepare a new command");
        return false;
    }
    if (flags.processing || (flags.waitingForUserConfirmation && !pending.isArmed()))
    {
        LOG_WARNING(prefix() + "Previous command still in progress - cannot prepare a new command");
        return false;
    }
    return true;
}

void ConfirmationManager::supersede()
{
    if (!pending.isArmed())
    {
        return;
    }

    LOG_INFO(prefix() + "Updating pending command from previous selection: " + pending.description);
    revertArmedToggle();
    pending.clear();
    flags.waitingForUserConfirmation = false;
}

bool ConfirmationManager::prepare(const PendingUserCommand &command, bool connected)
{
    if (!canPrepare(connected))
    {
        return false;
    }
    if (command.kind == CommandKind::NONE || command.text.empty())
    {
        LOG_ERROR(prefix() + "Invalid command for confirmation");
        return false;
    }

    supersede();

    bool firstArm = safetyTimer == NO_TIMER;

    pending = command;
    pending.armedAtMs = scheduler.now();

    flags.waitingForUserConfirmation = true;
    panel.setWaiting(true);
    panel.setConfirmEnabled(true);

    // Short timeout restarts with every arm
    scheduler.cancel(armedTimer);
    armedTimer = scheduler.schedule(RESPONSE_TIMEOUT_MS, [this]()
                                    {
                                        armedTimer = NO_TIMER;
                                        LOG_INFO(prefix() + "User confirmation timeout - cancelling pending command");
                                        cancel("timeout"); },
                                    "confirm-timeout");

    // Absolute cap counted from the first arm, not restarted by re-arming
    if (firstArm)
    {
        safetyTimer = scheduler.schedule(CONFIRMATION_SAFETY_MS, [this]()
                                         {
                                             safetyTimer = NO_TIMER;
                                             if (pending.isArmed())
                                             {
                                                 LOG_WARNING(prefix() + "Extended timeout reached - auto-cancelling pending command");
                                                 cancel("safety timeout");
                                             } },
                                         "confirm-safety");
    }

    LOG_INFO(prefix() + "Command prepared for confirmation: " + pending.description);
    return true;
}

bool ConfirmationManager::takeForExecution(PendingUserCommand &command)
{
    if (!pending.isArmed())
    {
        LOG_ERROR(prefix() + "No pending command to execute");
        return false;
    }

    stopArmingTimers();
    command = pending;
    pending.clear();
    panel.setConfirmEnabled(false);
    return true;
}

bool ConfirmationManager::cancel(const std::string &reason)
{
    if (!pending.isArmed())
    {
        LOG_WARNING(prefix() + "No pending command to cancel");
        return false;
    }

    LOG_INFO(prefix() + "Cancelling pending command (" + reason + "): " + pending.description);
    revertArmedToggle();
    pending.clear();
    stopArmingTimers();

    flags.waitingForUserConfirmation = false;
    panel.setWaiting(false);
    panel.setConfirmEnabled(false);
    return true;
}

void ConfirmationManager::completeUserConfirmation()
{
    if (!flags.waitingForUserConfirmation || pending.isArmed())
    {
        return;
    }

    LOG_DEBUG(prefix() + "Clearing user confirmation state after PDU response");
    flags.waitingForUserConfirmation = false;
    panel.setConfirmEnabled(false);
}

bool ConfirmationManager::beginServerConfirmation(TimeoutCallback onTimeout)
{
    // Never both at once: the user layer answers the server itself
    if (flags.waitingForUserConfirmation)
    {
        return false;
    }

    LOG_DEBUG(prefix() + "Legacy PDU confirmation prompt - waiting for user input");
    flags.serverConfirmationPending = true;
    panel.setWaiting(true);
    panel.setConfirmEnabled(true);

    scheduler.cancel(serverTimer);
    serverTimer = scheduler.schedule(RESPONSE_TIMEOUT_MS, [this, onTimeout]()
                                     {
                                         serverTimer = NO_TIMER;
                                         LOG_INFO(prefix() + "PDU confirmation timeout");
                                         if (onTimeout)
                                         {
                                             onTimeout();
                                         } },
                                     "server-confirm-timeout");
    return true;
}

void ConfirmationManager::endServerConfirmation()
{
    scheduler.cancel(serverTimer);
    serverTimer = NO_TIMER;
    flags.serverConfirmationPending = false;
    panel.setWaiting(false);
    panel.setConfirmEnabled(false);
}

void ConfirmationManager::reset()
{
    stopArmingTimers();
    scheduler.cancel(serverTimer);
    serverTimer = NO_TIMER;
    pending.clear();
    flags.waitingForUserConfirmation = false;
    flags.serverConfirmationPending = false;
    panel.setConfirmEnabled(false);
}

#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include "control_panel.h"
#include "session_state.h"
#include "timer_scheduler.h"

/**
 * @brief Two-layer confirmation for user power commands
 *
 * Layer 1 (arming): a toggle or cycle press stores a PendingUserCommand and
 * waits for confirm/cancel. Only one command is ever armed; arming another
 * reverts the previous toggle first.
 *
 * Layer 2 (execution): confirm hands the command to the session for sending.
 * waitingForUserConfirmation stays set until the PDU's response arrives, so
 * a server-side "Do you wish to continue?" for that command is answered
 * automatically instead of being surfaced twice.
 *
 * A server prompt that arrives with no user confirmation active is the
 * legacy path: it is surfaced with its own timeout.
 */
class ConfirmationManager
{
public:
    typedef std::function<void()> TimeoutCallback;

    ConfirmationManager(SessionFlags &flags, ControlPanel &panel, TimerScheduler &scheduler);
    ~ConfirmationManager();

    void setTag(const std::string &newTag) { tag = newTag; }

    // Whether a new command may be armed right now
    bool canPrepare(bool connected) const;

    /**
     * @brief Reverts and drops the currently armed command, if any
     * Call after canPrepare() and before reading the prior state of the
     * control being armed.
     */
    void supersede();

    /**
     * @brief Arms a command
     * @param command Fully described command; armedAtMs is filled in here
     * @return false when connected is false or the session cannot accept one
     */
    bool prepare(const PendingUserCommand &command, bool connected);

    /**
     * @brief Moves the armed command out for execution
     * Stops the arming timers and disables confirm/cancel. The user
     * confirmation flag stays set until completeUserConfirmation().
     */
    bool takeForExecution(PendingUserCommand &command);

    // User cancel or timeout: revert the armed toggle, clear everything
    bool cancel(const std::string &reason);

    // The response to an executed user command has arrived
    void completeUserConfirmation();

    // Legacy server prompt (no user confirmation active)
    bool beginServerConfirmation(TimeoutCallback onTimeout);
    void endServerConfirmation();

    void reset();

    bool isArmed() const { return pending.isArmed(); }
    const PendingUserCommand &getPending() const { return pending; }

private:
    SessionFlags &flags;
    ControlPanel &panel;
    TimerScheduler &scheduler;
    std::string tag = "pdu";

    PendingUserCommand pending;
    TimerId armedTimer = NO_TIMER;
    TimerId safetyTimer = NO_TIMER;
    TimerId serverTimer = NO_TIMER;

    void revertArmedToggle();
    void stopArmingTimers();
    std::string prefix() const { return "[" + tag + "] "; }
};

#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include "broadcast_coordinator.h"
#include "command_queue.h"
#include "confirmation_manager.h"
#include "control_panel.h"
#include "pdu_transport.h"
#include "poller.h"
#include "reconnect_manager.h"
#include "response_framer.h"
#include "session_config.h"
#include "session_state.h"
#include "step_sequence.h"
#include "timer_scheduler.h"

/**
 * @brief Stateful client for one PDU's telnet CLI
 *
 * Owns the connection lifecycle, login handshake, command dispatch,
 * confirmation handling, polling, reconnection and broadcast participation
 * for a single endpoint. Everything runs on the caller's thread: transport
 * events arrive through TransportListener and all delays are timers on the
 * shared TimerScheduler.
 *
 * Several sessions can share one scheduler and one BroadcastChannel.
 */
class PduSession : public TransportListener
{
public:
    typedef std::function<void()> ChangeListener;

    PduSession(const SessionConfig &config, PduTransport &transport,
               TimerScheduler &scheduler, BroadcastChannel &channel);
    ~PduSession();

    PduSession(const PduSession &) = delete;
    PduSession &operator=(const PduSession &) = delete;

    /**
     * @brief Starts health checks and, if configured, the auto-connect
     */
    void begin();

    /**
     * @brief Replaces the endpoint configuration
     * A changed host or port on a live link reconnects to the new endpoint.
     */
    void applyConfig(const SessionConfig &newConfig);

    // ---------------------------------------------------------------------
    // Connection control
    // ---------------------------------------------------------------------

    /**
     * @brief The "Connect" toggle
     * @param enabled true opens the link and keeps it up, false tears it down
     * @return false if the connection could not be initiated
     */
    bool connect(bool enabled);

    // ---------------------------------------------------------------------
    // User intents
    // ---------------------------------------------------------------------

    bool toggleOutlet(uint8_t index);
    bool toggleGroup(uint8_t index);
    bool cycleOutlet(uint8_t index);
    bool cycleGroup(uint8_t index);
    bool confirm();
    bool cancel();

    /**
     * @brief Cycles a group by its legend, without user confirmation
     * The lookup is case-insensitive. Also starts a broadcast so peer PDUs
     * with a group of the same name follow.
     */
    bool triggerGroupByName(const std::string &groupName);

    void selectMode(OperationMode mode) { panel.selectMode(mode); }
    void deselectMode(OperationMode mode) { panel.deselectMode(mode); }

    /**
     * @brief Clears every busy, confirmation and broadcast flag
     * Also drops the pending command, the queue, the buffer and the
     * indicators. The revert guard and post-group cooldown windows are
     * left to expire on their own.
     */
    void resetTransientState();

    void setChangeListener(ChangeListener listener) { changeListener = listener; }

    // ---------------------------------------------------------------------
    // TransportListener
    // ---------------------------------------------------------------------
    void onTransportConnected() override;
    void onTransportData(const char *data, size_t length) override;
    void onTransportClosed() override;
    void onTransportError(const std::string &detail) override;
    void onTransportTimeout() override;

    // ---------------------------------------------------------------------
    // Inspection
    // ---------------------------------------------------------------------
    const SessionConfig &getConfig() const { return config; }
    const SessionFlags &getFlags() const { return flags; }
    const ControlPanel &getPanel() const { return panel; }
    const CommandQueue &getQueue() const { return queue; }
    const ResponseFramer &getFramer() const { return framer; }
    const ConfirmationManager &getConfirmations() const { return confirmations; }
    const Poller &getPoller() const { return poller; }
    const ReconnectManager &getReconnect() const { return reconnect; }
    const BroadcastCoordinator &getBroadcast() const { return broadcast; }
    const OperationRecord &getCurrentOperation() const { return currentOperation; }
    const PerformanceStats &getPerformance() const { return performance; }
    const ErrorStats &getErrors() const { return errors; }
    const std::string &getTag() const { return config.tag; }
    bool isBusy() const;
    SessionHealth getHealth() const;

private:
    SessionConfig config;
    PduTransport &transport;
    TimerScheduler &scheduler;

    PerformanceStats performance;
    ErrorStats errors;
    SessionFlags flags;
    OperationRecord currentOperation;
    std::string groupOperationCommand;
    bool authenticationRejected = false;

    ControlPanel panel;
    ResponseFramer framer;
    CommandQueue queue;
    ConfirmationManager confirmations;
    Poller poller;
    ReconnectManager reconnect;
    BroadcastCoordinator broadcast;
    StepSequence refreshSequence;

    ChangeListener changeListener;

    TimerId usernameTimer = NO_TIMER;
    TimerId passwordTimer = NO_TIMER;
    TimerId processingSafetyTimer = NO_TIMER;
    TimerId revertGuardTimer = NO_TIMER;
    TimerId cooldownTimer = NO_TIMER;
    TimerId stuckCheckTimer = NO_TIMER;
    TimerId healthTimer = NO_TIMER;
    TimerId autoConnectTimer = NO_TIMER;

    // Wiring
    void wireComponents();
    void buildRefreshSequence();

    // Connection
    bool openTransport();
    void requestReconnect();
    void handleConnectionLoss(ErrorType type, const std::string &status);
    void cancelLoginTimers();

    // Inbound frames
    void handleFrame(FrameKind kind);
    void handleUsernamePrompt();
    void handlePasswordPrompt();
    void handleWelcome();
    void handleAuthFailure();
    void handleConfirmationPrompt();
    void handleResponse();

    // Commands
    bool armToggle(CommandKind kind, uint8_t index);
    bool armCycle(CommandKind kind, uint8_t index);
    bool executePending();
    void submitUserCommand(const PduCommand &command);
    void beginGroupOperation(const std::string &commandText);
    void finishGroupOperation();
    bool runReceiverAction(uint8_t groupIndex);
    void confirmServerPrompt();
    void rejectServerPrompt(const char *reason);
    void handleRetriesExhausted(const PduCommand &command);
    void revertToPreviousState();

    // Indicators and periodic checks
    void setProcessing(bool on);
    void startProcessingSafety();
    void updateInteractivity();
    void onPanelChanged();
    void checkStuckProcessing();
    void logHealth();

    bool userCommandQueued() const;
    // A user command queued or outstanding, armed, or awaiting the server prompt
    bool hasLocalUserWork() const;
    std::string outletCommand(uint8_t index, const char *action) const;
    std::string groupCommand(uint8_t index, const char *action) const;
    std::string prefix() const { return "[" + config.tag + "] "; }
};

#include "pdu_session.h"
#include "logger.h"
#include "response_parser.h"

PduSession::PduSession(const SessionConfig &config, PduTransport &transport,
                       TimerScheduler &scheduler, BroadcastChannel &channel)
    : config(config),
      transport(transport),
      scheduler(scheduler),
      framer(config.prompt),
      queue(transport, scheduler, performance, errors),
      confirmations(flags, panel, scheduler),
      poller(scheduler),
      reconnect(scheduler),
      broadcast(channel, scheduler, config.tag),
      refreshSequence(scheduler, config.tag + "-refresh")
{
    transport.setListener(this);
    wireComponents();
    buildRefreshSequence();
}

PduSession::~PduSession()
{
    transport.setListener(nullptr);
    cancelLoginTimers();
    scheduler.cancel(processingSafetyTimer);
    scheduler.cancel(revertGuardTimer);
    scheduler.cancel(cooldownTimer);
    scheduler.cancel(stuckCheckTimer);
    scheduler.cancel(healthTimer);
    scheduler.cancel(autoConnectTimer);
}

// ---------------------------------------------------------------------------
// Wiring
// ---------------------------------------------------------------------------

void PduSession::wireComponents()
{
    queue.setTag(config.tag);
    confirmations.setTag(config.tag);
    poller.setTag(config.tag);
    reconnect.setTag(config.tag);

    panel.setChangeListener([this]()
                            { onPanelChanged(); });

    queue.setConnectionLostCallback([this](const PduCommand &)
                                    { requestReconnect(); });
    queue.setRetriesExhaustedCallback([this](const PduCommand &command)
                                      { handleRetriesExhausted(command); });

    poller.setBusyCheck([this]()
                        { return isBusy(); });
    poller.setOutletQuerySuppressed([this]()
                                    { return flags.groupOperationInFlight || flags.postGroupCooldown; });
    poller.setBatchSink([this](const std::vector<PduCommand> &batch)
                        {
                            if (!flags.authenticated)
                            {
                                return;
                            }
                            queue.enqueue(batch);
                            queue.processNext(); });

    reconnect.setAttemptCallback([this]()
                                 {
                                     if (!transport.isConnected())
                                     {
                                         openTransport();
                                     } });
    reconnect.setExhaustedCallback([this]()
                                   { panel.setStatus("Max Reconnect Attempts Reached", StatusLevel::FAULT); });

    broadcast.setGroupLookup([this](const std::string &name)
                             { return panel.findGroupByName(name); });
    broadcast.setReceiverAction([this](uint8_t groupIndex)
                                { return runReceiverAction(groupIndex); });
    broadcast.setAbortCallback([this]()
                               {
                                   if (hasLocalUserWork())
                                   {
                                       LOG_DEBUG(prefix() + "Broadcast aborted - keeping local command in progress");
                                       return;
                                   }
                                   resetTransientState(); });
    broadcast.setDeferCheck([this]()
                            { return hasLocalUserWork(); });
}

void PduSession::buildRefreshSequence()
{
    refreshSequence
        .then(1000, [this]()
              {
                  if (!transport.isConnected())
                  {
                      resetTransientState();
                      return false;
                  }
                  LOG_DEBUG(prefix() + "Command executed, waiting for operation to complete...");
                  return true; })
        .then(2000, [this]()
              {
                  if (!transport.isConnected())
                  {
                      resetTransientState();
                      return false;
                  }
                  LOG_DEBUG(prefix() + "Sending status refresh commands...");
                  queue.push(PduCommand::query("show outlets"));
                  queue.processNext();
                  return true; })
        .then(1000, [this]()
              {
                  if (transport.isConnected())
                  {
                      queue.push(PduCommand::query("show outletgroups"));
                      queue.processNext();
                  }
                  return true; })
        .then(3000, [this]()
              {
                  if (!transport.isConnected())
                  {
                      resetTransientState();
                      return false;
                  }
                  LOG_DEBUG(prefix() + "Status refresh commands sent, waiting for responses...");
                  return true; })
        .then(5000, [this]()
              {
                  if (transport.isConnected())
                  {
                      poller.restart();
                  }
                  return true; });
}

void PduSession::begin()
{
    LOG_INFO(prefix() + "Session initialized for " + (config.hasHost() ? config.host : std::string("<no host>")) +
             ":" + std::to_string(config.port));

    scheduler.cancel(stuckCheckTimer);
    stuckCheckTimer = scheduler.schedule(STUCK_PROCESSING_CHECK_MS, [this]()
                                         { checkStuckProcessing(); },
                                         "stuck-check");
    scheduler.cancel(healthTimer);
    healthTimer = scheduler.schedule(HEALTH_REPORT_INTERVAL_MS, [this]()
                                     { logHealth(); },
                                     "health");

    if (config.connectOnStart && config.hasHost())
    {
        scheduler.cancel(autoConnectTimer);
        autoConnectTimer = scheduler.schedule(AUTO_CONNECT_DELAY_MS, [this]()
                                              {
                                                  autoConnectTimer = NO_TIMER;
                                                  if (!transport.isConnected())
                                                  {
                                                      LOG_INFO(prefix() + "Auto-connecting to PDU on startup...");
                                                      connect(true);
                                                  } },
                                              "auto-connect");
    }
    else
    {
        LOG_INFO(prefix() + "Waiting for connection configuration...");
    }
}

void PduSession::applyConfig(const SessionConfig &newConfig)
{
    bool endpointChanged = newConfig.host != config.host || newConfig.port != config.port;
    bool wasUp = flags.stayConnected;

    // The tag doubles as the broadcast origin and cannot change at runtime
    std::string tag = config.tag;
    config = newConfig;
    config.tag = tag;
    framer.setPrompt(config.prompt);

    LOG_INFO(prefix() + "Configuration updated: " + config.host + ":" + std::to_string(config.port));

    if (endpointChanged && wasUp)
    {
        connect(false);
        connect(true);
    }
}

// ---------------------------------------------------------------------------
// Connection control
// ---------------------------------------------------------------------------

bool PduSession::connect(bool enabled)
{
    flags.stayConnected = enabled;

    if (enabled)
    {
        if (transport.isConnected())
        {
            return true;
        }
        authenticationRejected = false;
        reconnect.reset();
        return openTransport();
    }

    reconnect.cancel();
    poller.stop();
    cancelLoginTimers();
    if (confirmations.isArmed())
    {
        confirmations.cancel("disconnect");
    }
    if (transport.isConnected())
    {
        transport.disconnect();
        LOG_INFO(prefix() + "Disconnected from PDU");
    }

    flags.connected = false;
    flags.authenticated = false;
    resetTransientState();
    panel.reset();
    panel.setStatus("Disconnected", StatusLevel::NOT_PRESENT);
    return true;
}

bool PduSession::openTransport()
{
    std::string reason;
    if (!config.validate(reason))
    {
        LOG_ERROR(prefix() + reason);
        return false;
    }

    LOG_INFO(prefix() + "Connecting to PDU: " + config.host + ":" + std::to_string(config.port));
    framer.setPrompt(config.prompt);

    if (!transport.connect(config.host, config.port))
    {
        LOG_ERROR(prefix() + "Failed to initiate connection to " + config.host);
        errors.record(ErrorType::CONNECTION_FAILED, scheduler.now());
        panel.setStatus("Connection Failed", StatusLevel::FAULT);
        if (flags.stayConnected)
        {
            requestReconnect();
        }
        return false;
    }
    return true;
}

void PduSession::requestReconnect()
{
    if (!flags.stayConnected || transport.isConnected() || !config.hasHost())
    {
        return;
    }
    if (reconnect.schedule())
    {
        performance.lastReconnectMs = scheduler.now();
    }
}

void PduSession::cancelLoginTimers()
{
    scheduler.cancel(usernameTimer);
    scheduler.cancel(passwordTimer);
    usernameTimer = NO_TIMER;
    passwordTimer = NO_TIMER;
}

// ---------------------------------------------------------------------------
// Transport events
// ---------------------------------------------------------------------------

void PduSession::onTransportConnected()
{
    LOG_INFO(prefix() + "Socket connected successfully to " + config.host + ":" + std::to_string(config.port));
    flags.connected = true;
    flags.authenticated = false;
    authenticationRejected = false;
    framer.clear();
    queue.clear();
    panel.setStatus("Connected", StatusLevel::OK);
    updateInteractivity();
}

void PduSession::onTransportData(const char *data, size_t length)
{
    if (!framer.append(data, length))
    {
        LOG_DEBUG(prefix() + "Response data dropped, buffer holds " + std::to_string(framer.size()) + " bytes");
    }
    else
    {
        LOG_DEBUG(prefix() + "RX: " + Logger::formatRaw(std::string(data, length)));
    }

    handleFrame(framer.detect(flags.authenticated));
}

void PduSession::onTransportClosed()
{
    handleConnectionLoss(ErrorType::SOCKET_CLOSED, "Socket Closed");
}

void PduSession::onTransportError(const std::string &detail)
{
    handleConnectionLoss(ErrorType::SOCKET_ERROR, "Socket Error: " + detail);
}

void PduSession::onTransportTimeout()
{
    handleConnectionLoss(ErrorType::SOCKET_TIMEOUT, "Socket Timeout");
}

void PduSession::handleConnectionLoss(ErrorType type, const std::string &status)
{
    LOG_ERROR(prefix() + status);
    errors.record(type, scheduler.now());

    flags.connected = false;
    flags.authenticated = false;
    cancelLoginTimers();
    poller.stop();

    if (confirmations.isArmed())
    {
        confirmations.cancel("connection lost");
    }
    resetTransientState();

    // Keep the authentication failure visible; it explains the close
    if (!authenticationRejected)
    {
        panel.setStatus(status, StatusLevel::FAULT);
    }

    if (flags.stayConnected)
    {
        requestReconnect();
    }
}

// ---------------------------------------------------------------------------
// Inbound frames
// ---------------------------------------------------------------------------

void PduSession::handleFrame(FrameKind kind)
{
    switch (kind)
    {
    case FrameKind::USERNAME:
        handleUsernamePrompt();
        break;
    case FrameKind::PASSWORD:
        handlePasswordPrompt();
        break;
    case FrameKind::WELCOME:
        handleWelcome();
        break;
    case FrameKind::AUTH_FAILED:
        handleAuthFailure();
        break;
    case FrameKind::CONFIRM_PROMPT:
        handleConfirmationPrompt();
        break;
    case FrameKind::RESPONSE:
        handleResponse();
        break;
    default:
        break;
    }
}

void PduSession::handleUsernamePrompt()
{
    LOG_INFO(prefix() + "Detected Username prompt, sending username...");
    framer.clear();

    scheduler.cancel(usernameTimer);
    usernameTimer = scheduler.schedule(USERNAME_SEND_DELAY_MS, [this]()
                                       {
                                           usernameTimer = NO_TIMER;
                                           if (transport.isConnected() && queue.sendCredential(config.username))
                                           {
                                               LOG_INFO(prefix() + "Sent username: " + config.username);
                                           } },
                                       "send-username");
}

void PduSession::handlePasswordPrompt()
{
    LOG_INFO(prefix() + "Detected Password prompt, sending password...");
    framer.clear();

    scheduler.cancel(passwordTimer);
    passwordTimer = scheduler.schedule(PASSWORD_SEND_DELAY_MS, [this]()
                                       {
                                           passwordTimer = NO_TIMER;
                                           if (transport.isConnected() && queue.sendCredential(config.password))
                                           {
                                               LOG_INFO(prefix() + "Sent password: " + std::string(config.password.size(), '*'));
                                           } },
                                       "send-password");
}

void PduSession::handleWelcome()
{
    LOG_INFO(prefix() + "Login successful!");
    framer.clear();
    flags.authenticated = true;
    reconnect.reset();
    performance.lastReconnectMs = 0;
    panel.setStatus("Logged In", StatusLevel::OK);
    updateInteractivity();

    poller.startAfter(FIRST_POLL_DELAY_MS);
}

void PduSession::handleAuthFailure()
{
    LOG_ERROR(prefix() + "Login failed! Check credentials.");
    framer.clear();
    errors.record(ErrorType::AUTHENTICATION_FAILED, scheduler.now());
    panel.setStatus("Authentication Failed", StatusLevel::FAULT);

    // No credential retries: the link stays down until connect(true)
    authenticationRejected = true;
    flags.stayConnected = false;
    reconnect.cancel();
    cancelLoginTimers();
    transport.disconnect();
    flags.connected = false;
    updateInteractivity();
}

void PduSession::handleConfirmationPrompt()
{
    LOG_DEBUG(prefix() + "Detected PDU confirmation prompt");
    framer.clear();

    if (flags.waitingForUserConfirmation)
    {
        LOG_DEBUG(prefix() + "Already in user confirmation mode - auto-confirming PDU prompt");
        queue.sendReply("y");
        return;
    }

    queue.suspendTimeout();
    confirmations.beginServerConfirmation([this]()
                                          { rejectServerPrompt("timeout"); });
}

void PduSession::handleResponse()
{
    std::string response = framer.contents();
    framer.clear();

    ApplyContext context;
    context.groupOperationInFlight = flags.groupOperationInFlight;
    context.revertingState = flags.revertingState;
    ParsedResponse parsed = ResponseParser::parse(response);
    ResponseParser::apply(parsed, panel, context);

    performance.responsesReceived++;
    performance.lastResponseMs = scheduler.now();

    PduCommand completed = queue.getOutstanding();
    queue.completeResponse();
    if (completed.userInitiated)
    {
        flags.userInitiatedCommand = false;
    }

    bool userCommandPending = userCommandQueued();
    if (flags.serverConfirmationPending || userCommandPending)
    {
        LOG_DEBUG(prefix() + "Keeping Processing LED ON - confirmation or user command in progress");
    }
    else
    {
        setProcessing(false);
    }

    if (completed.userInitiated && !userCommandPending)
    {
        confirmations.completeUserConfirmation();
        currentOperation.clear();
    }
    if (!confirmations.isArmed() && !flags.serverConfirmationPending && !userCommandPending)
    {
        panel.setWaiting(false);
    }

    if (flags.groupOperationInFlight && !completed.text.empty() && completed.text == groupOperationCommand)
    {
        finishGroupOperation();
    }

    queue.processNext();
    updateInteractivity();
}

// ---------------------------------------------------------------------------
// User intents
// ---------------------------------------------------------------------------

std::string PduSession::outletCommand(uint8_t index, const char *action) const
{
    return "power outlets " + std::to_string(index) + " " + action;
}

std::string PduSession::groupCommand(uint8_t index, const char *action) const
{
    return "power outletgroup " + std::to_string(index) + " " + action;
}

bool PduSession::toggleOutlet(uint8_t index)
{
    if (panel.getMode() == OperationMode::CYCLE)
    {
        return armCycle(CommandKind::OUTLET_CYCLE, index);
    }
    return armToggle(CommandKind::OUTLET_TOGGLE, index);
}

bool PduSession::toggleGroup(uint8_t index)
{
    if (panel.getMode() == OperationMode::CYCLE)
    {
        return armCycle(CommandKind::GROUP_CYCLE, index);
    }
    return armToggle(CommandKind::GROUP_TOGGLE, index);
}

bool PduSession::cycleOutlet(uint8_t index)
{
    return armCycle(CommandKind::OUTLET_CYCLE, index);
}

bool PduSession::cycleGroup(uint8_t index)
{
    return armCycle(CommandKind::GROUP_CYCLE, index);
}

bool PduSession::armToggle(CommandKind kind, uint8_t index)
{
    bool isGroup = isGroupCommand(kind);
    if (isGroup ? !panel.isGroupInputEnabled(index) : !panel.isOutletInputEnabled(index))
    {
        LOG_WARNING(prefix() + "Control not available for " + commandKindToString(kind) + " " + std::to_string(index));
        return false;
    }
    if (!confirmations.canPrepare(transport.isConnected()))
    {
        return false;
    }

    confirmations.supersede();

    bool prior = isGroup ? panel.getGroup(index).powered : panel.getOutlet(index).powered;
    bool intended = !prior;
    const std::string &name = isGroup ? panel.getGroup(index).name : panel.getOutlet(index).name;
    const char *action = intended ? "on" : "off";

    PendingUserCommand command;
    command.kind = kind;
    command.index = index;
    command.text = isGroup ? groupCommand(index, action) : outletCommand(index, action);
    command.intendedState = intended;
    command.priorState = prior;
    command.description = "Turn " + name + (intended ? " ON" : " OFF");

    // Optimistic toggle; cancel or timeout puts it back
    if (isGroup)
    {
        panel.setGroupState(index, intended);
    }
    else
    {
        panel.setOutletState(index, intended);
    }

    if (!confirmations.prepare(command, transport.isConnected()))
    {
        if (isGroup)
        {
            panel.setGroupState(index, prior);
        }
        else
        {
            panel.setOutletState(index, prior);
        }
        return false;
    }

    updateInteractivity();
    return true;
}

bool PduSession::armCycle(CommandKind kind, uint8_t index)
{
    bool isGroup = isGroupCommand(kind);
    if (isGroup ? !panel.isGroupInputEnabled(index) : !panel.isOutletInputEnabled(index))
    {
        LOG_WARNING(prefix() + "Control not available for " + commandKindToString(kind) + " " + std::to_string(index));
        return false;
    }
    if (isGroup && broadcast.isProcessing())
    {
        LOG_INFO(prefix() + "Already processing a broadcast, please wait...");
        return false;
    }
    if (!confirmations.canPrepare(transport.isConnected()))
    {
        return false;
    }

    confirmations.supersede();

    bool current = isGroup ? panel.getGroup(index).powered : panel.getOutlet(index).powered;
    const std::string &name = isGroup ? panel.getGroup(index).name : panel.getOutlet(index).name;

    PendingUserCommand command;
    command.kind = kind;
    command.index = index;
    command.text = isGroup ? groupCommand(index, "cycle") : outletCommand(index, "cycle");
    command.intendedState = current;
    command.priorState = current;
    command.description = "Power cycle " + name;

    if (!confirmations.prepare(command, transport.isConnected()))
    {
        return false;
    }

    updateInteractivity();
    return true;
}

bool PduSession::confirm()
{
    if (confirmations.isArmed())
    {
        LOG_INFO(prefix() + "User confirmed pending command");
        if (!executePending())
        {
            return false;
        }
        setProcessing(true);
        refreshSequence.start();
        startProcessingSafety();
        return true;
    }

    if (flags.serverConfirmationPending)
    {
        confirmServerPrompt();
        return true;
    }

    LOG_DEBUG(prefix() + "Nothing to confirm");
    return false;
}

bool PduSession::cancel()
{
    if (confirmations.isArmed())
    {
        LOG_INFO(prefix() + "User cancelled pending command");
        bool cancelled = confirmations.cancel("user");
        updateInteractivity();
        return cancelled;
    }

    if (flags.serverConfirmationPending)
    {
        rejectServerPrompt("user");
        return true;
    }

    LOG_DEBUG(prefix() + "Nothing to cancel");
    return false;
}

bool PduSession::executePending()
{
    PendingUserCommand command;
    if (!confirmations.takeForExecution(command))
    {
        return false;
    }

    LOG_INFO(prefix() + "Executing pending command: " + command.description);

    currentOperation.kind = command.kind;
    currentOperation.index = command.index;
    currentOperation.priorState = command.priorState;

    flags.userInitiatedCommand = true;
    panel.setWaiting(true);

    if (isGroupCommand(command.kind))
    {
        beginGroupOperation(command.text);
        if (command.kind == CommandKind::GROUP_CYCLE)
        {
            broadcast.initiate(command.index, panel.getGroup(command.index).name);
        }
    }

    submitUserCommand(PduCommand::user(command.text));
    return true;
}

bool PduSession::triggerGroupByName(const std::string &groupName)
{
    if (groupName.empty())
    {
        LOG_WARNING(prefix() + "Empty group name provided for trigger");
        return false;
    }
    if (!transport.isConnected())
    {
        LOG_ERROR(prefix() + "TCP connection not available for group trigger");
        return false;
    }
    if (flags.processing || broadcast.isProcessing() || flags.serverConfirmationPending)
    {
        LOG_WARNING(prefix() + "System busy - cannot process group trigger for: " + groupName);
        return false;
    }

    uint8_t groupIndex = panel.findGroupByName(groupName);
    if (groupIndex == 0)
    {
        LOG_WARNING(prefix() + "Group not found: " + groupName);
        return false;
    }

    LOG_INFO(prefix() + "String trigger: Group '" + groupName + "' (index " + std::to_string(groupIndex) + ") - power cycling");

    currentOperation.kind = CommandKind::GROUP_CYCLE;
    currentOperation.index = groupIndex;
    currentOperation.priorState = panel.getGroup(groupIndex).powered;

    std::string text = groupCommand(groupIndex, "cycle");
    flags.userInitiatedCommand = true;
    panel.setWaiting(true);
    beginGroupOperation(text);
    broadcast.initiate(groupIndex, panel.getGroup(groupIndex).name);

    submitUserCommand(PduCommand::user(text, RESPONSE_TIMEOUT_MS * 2));
    updateInteractivity();
    return true;
}

bool PduSession::runReceiverAction(uint8_t groupIndex)
{
    if (!transport.isConnected() || !flags.authenticated)
    {
        return false;
    }

    bool powerOn = config.receiverAction == ReceiverAction::POWER_ON;
    std::string text = groupCommand(groupIndex, powerOn ? "on" : "cycle");
    LOG_INFO(prefix() + "Broadcast receiver sending: " + text);

    currentOperation.kind = powerOn ? CommandKind::GROUP_TOGGLE : CommandKind::GROUP_CYCLE;
    currentOperation.index = groupIndex;
    currentOperation.priorState = panel.getGroup(groupIndex).powered;

    beginGroupOperation(text);
    submitUserCommand(PduCommand::user(text));
    updateInteractivity();
    return true;
}

void PduSession::submitUserCommand(const PduCommand &command)
{
    // Held at the head; a poll response still outstanding lands first
    queue.submitPriority(command);
    queue.processNext();
}

void PduSession::beginGroupOperation(const std::string &commandText)
{
    flags.groupOperationInFlight = true;
    groupOperationCommand = commandText;
}

void PduSession::finishGroupOperation()
{
    LOG_DEBUG(prefix() + "Group operation flag cleared");
    flags.groupOperationInFlight = false;
    groupOperationCommand.clear();
    broadcast.complete();

    flags.postGroupCooldown = true;
    scheduler.cancel(cooldownTimer);
    cooldownTimer = scheduler.schedule(POST_GROUP_COOLDOWN_MS, [this]()
                                       {
                                           cooldownTimer = NO_TIMER;
                                           flags.postGroupCooldown = false;
                                           LOG_DEBUG(prefix() + "Post-group operation period ended"); },
                                       "post-group-cooldown");
}

// ---------------------------------------------------------------------------
// Legacy server confirmation
// ---------------------------------------------------------------------------

void PduSession::confirmServerPrompt()
{
    queue.sendReply("y");
    LOG_INFO(prefix() + "PDU command confirmed - sending 'y'");

    confirmations.endServerConfirmation();
    setProcessing(true);
    refreshSequence.start();
    startProcessingSafety();
}

void PduSession::rejectServerPrompt(const char *reason)
{
    LOG_INFO(prefix() + "PDU command cancelled (" + reason + ") - sending 'n'");
    queue.sendReply("n");

    confirmations.endServerConfirmation();
    setProcessing(false);
    revertToPreviousState();
    resetTransientState();
}

// ---------------------------------------------------------------------------
// Failure paths
// ---------------------------------------------------------------------------

void PduSession::handleRetriesExhausted(const PduCommand &command)
{
    LOG_INFO(prefix() + "Retry failed or max attempts reached - reverting state and cleaning up: " + command.text);

    if (command.userInitiated)
    {
        revertToPreviousState();
    }
    resetTransientState();
}

void PduSession::revertToPreviousState()
{
    if (!currentOperation.isValid())
    {
        LOG_DEBUG(prefix() + "No specific operation tracked, nothing to revert");
        return;
    }

    flags.revertingState = true;

    switch (currentOperation.kind)
    {
    case CommandKind::OUTLET_TOGGLE:
        panel.setOutletState(currentOperation.index, currentOperation.priorState);
        LOG_DEBUG(prefix() + "Reverted outlet " + std::to_string(currentOperation.index) + " to previous state: " +
                  (currentOperation.priorState ? "true" : "false"));
        break;
    case CommandKind::GROUP_TOGGLE:
        panel.setGroupState(currentOperation.index, currentOperation.priorState);
        LOG_DEBUG(prefix() + "Reverted group " + std::to_string(currentOperation.index) + " to previous state: " +
                  (currentOperation.priorState ? "true" : "false"));
        break;
    default:
        LOG_DEBUG(prefix() + "Cycle operation cancelled for " + std::to_string(currentOperation.index) +
                  " - no state reversion needed");
        break;
    }

    currentOperation.clear();

    scheduler.cancel(revertGuardTimer);
    revertGuardTimer = scheduler.schedule(REVERT_GUARD_MS, [this]()
                                          {
                                              revertGuardTimer = NO_TIMER;
                                              flags.revertingState = false;
                                              LOG_DEBUG(prefix() + "State reversion protection period ended"); },
                                          "revert-guard");
}

void PduSession::resetTransientState()
{
    confirmations.reset();
    // Peers are still settling on a cycle we started; tell them to stand down
    broadcast.cancelIntent();
    broadcast.complete();
    refreshSequence.cancel();
    queue.clear();
    framer.clear();

    scheduler.cancel(processingSafetyTimer);
    processingSafetyTimer = NO_TIMER;

    flags.processing = false;
    flags.userInitiatedCommand = false;
    flags.groupOperationInFlight = false;
    groupOperationCommand.clear();

    panel.setProcessing(false);
    panel.setWaiting(false);
    panel.setConfirmEnabled(false);
    updateInteractivity();
}

// ---------------------------------------------------------------------------
// Indicators and periodic checks
// ---------------------------------------------------------------------------

void PduSession::setProcessing(bool on)
{
    flags.processing = on;
    panel.setProcessing(on);
    updateInteractivity();
}

void PduSession::startProcessingSafety()
{
    scheduler.cancel(processingSafetyTimer);
    processingSafetyTimer = scheduler.schedule(PROCESSING_SAFETY_MS, [this]()
                                               {
                                                   processingSafetyTimer = NO_TIMER;
                                                   if (!panel.isProcessing())
                                                   {
                                                       return;
                                                   }
                                                   LOG_WARNING(prefix() + "Processing LED timeout - forcing OFF after 30 seconds");
                                                   setProcessing(false);
                                                   flags.waitingForUserConfirmation = false;
                                                   if (flags.serverConfirmationPending)
                                                   {
                                                       confirmations.endServerConfirmation();
                                                   }
                                                   panel.setConfirmEnabled(false);
                                                   panel.setWaiting(false);
                                                   updateInteractivity(); },
                                               "processing-safety");
}

void PduSession::updateInteractivity()
{
    bool locked = !flags.authenticated || panel.isProcessing() ||
                  (panel.isWaiting() && !flags.waitingForUserConfirmation);
    panel.setControlsLocked(locked);
}

void PduSession::onPanelChanged()
{
    updateInteractivity();
    if (changeListener)
    {
        changeListener();
    }
}

void PduSession::checkStuckProcessing()
{
    if (panel.isProcessing() && !flags.serverConfirmationPending && !queue.isAwaitingResponse() &&
        queue.size() == 0 && !refreshSequence.isRunning())
    {
        LOG_WARNING(prefix() + "Processing LED stuck ON without active operations - forcing OFF");
        setProcessing(false);
    }

    stuckCheckTimer = scheduler.schedule(STUCK_PROCESSING_CHECK_MS, [this]()
                                         { checkStuckProcessing(); },
                                         "stuck-check");
}

void PduSession::logHealth()
{
    SessionHealth health = getHealth();
    LOG_INFO(prefix() + "System Health - Connected: " + (health.connected ? "true" : "false") +
             ", LoggedIn: " + (health.authenticated ? "true" : "false") +
             ", Errors: " + std::to_string(health.errors.total()) +
             ", Commands: " + std::to_string(health.performance.responsesReceived) + "/" +
             std::to_string(health.performance.commandsSent));

    if (health.errors.total() > HIGH_ERROR_THRESHOLD)
    {
        LOG_WARNING(prefix() + "High error count detected: " + std::to_string(health.errors.total()) +
                    " errors in session");
    }

    if (!transport.isConnected() && flags.stayConnected)
    {
        LOG_WARNING(prefix() + "Connection lost but Connect is ON - attempting reconnection");
        requestReconnect();
    }

    healthTimer = scheduler.schedule(HEALTH_REPORT_INTERVAL_MS, [this]()
                                     { logHealth(); },
                                     "health");
}

bool PduSession::userCommandQueued() const
{
    for (const auto &command : queue.getPending())
    {
        if (command.userInitiated)
        {
            return true;
        }
    }
    return queue.isAwaitingResponse() && queue.getOutstanding().userInitiated;
}

bool PduSession::hasLocalUserWork() const
{
    return userCommandQueued() || confirmations.isArmed() || flags.serverConfirmationPending;
}

bool PduSession::isBusy() const
{
    return queue.isAwaitingResponse() || flags.processing || flags.serverConfirmationPending ||
           flags.waitingForUserConfirmation || flags.groupOperationInFlight || flags.revertingState;
}

SessionHealth PduSession::getHealth() const
{
    SessionHealth health;
    health.connected = transport.isConnected();
    health.authenticated = flags.authenticated;
    health.reconnectAttempts = reconnect.getAttempts();
    health.pollingActive = poller.isActive();
    health.awaitingResponse = queue.isAwaitingResponse();
    health.performance = performance;
    health.errors = errors;
    health.flags = flags;
    return health;
}

#include "session_manager.h"
#include "device_state.h"
#include "event_manager.h"
#include "logger.h"

// Static member definitions
TimerScheduler SessionManager::scheduler(MAX_ACTIVE_TIMERS);
BroadcastChannel SessionManager::channel;
AsyncTcpTransport *SessionManager::transports[MAX_ENDPOINTS] = {nullptr};
PduSession *SessionManager::sessions[MAX_ENDPOINTS] = {nullptr};
bool SessionManager::initialized = false;

void SessionManager::init()
{
    if (initialized)
    {
        return;
    }

    scheduler.update(millis());

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        const EndpointSettings &endpoint = DeviceState::getEndpoint(slot);

        transports[slot] = new AsyncTcpTransport();
        sessions[slot] = new PduSession(endpoint.session, *transports[slot], scheduler, channel);
        sessions[slot]->selectMode(endpoint.mode);
        sessions[slot]->setChangeListener([slot]()
                                          { EventManager::triggerPanelChange(slot); });
        sessions[slot]->begin();
    }

    initialized = true;
    LOG_INFO("Session manager initialized with " + std::to_string(MAX_ENDPOINTS) + " endpoint slots");
}

void SessionManager::update()
{
    if (!initialized)
    {
        return;
    }

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        transports[slot]->processEvents();
    }
    scheduler.update(millis());
}

PduSession *SessionManager::getSession(uint8_t slot)
{
    if (!initialized || !DeviceState::isValidSlot(slot))
    {
        return nullptr;
    }
    return sessions[slot];
}

bool SessionManager::applyEndpoint(uint8_t slot, const SessionConfig &config, String &error)
{
    if (!DeviceState::setEndpoint(slot, config, error))
    {
        return false;
    }

    PduSession *session = getSession(slot);
    if (session)
    {
        session->applyConfig(DeviceState::getEndpoint(slot).session);
    }
    return true;
}

void SessionManager::setMode(uint8_t slot, OperationMode mode)
{
    PduSession *session = getSession(slot);
    if (!session)
    {
        return;
    }
    session->selectMode(mode);
    DeviceState::setOperationMode(slot, session->getPanel().getMode());
}

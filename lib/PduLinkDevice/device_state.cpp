#include "device_state.h"
#include "logger.h"

// Static member definitions
DeviceConfig DeviceState::deviceConfig;
EndpointSettings DeviceState::endpoints[MAX_ENDPOINTS];
unsigned long DeviceState::bootTime = 0;

void DeviceState::init()
{
    bootTime = millis();
    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        endpoints[slot].session.tag = slotTag(slot).c_str();
    }
    loadFromPreferences();
    incrementRebootCounter();
    LOG_INFO("Device state initialized");
}

String DeviceState::slotTag(uint8_t slot)
{
    return "pdu" + String(slot + 1);
}

String DeviceState::endpointNamespace(uint8_t slot)
{
    return "endpoint" + String(slot + 1);
}

void DeviceState::loadFromPreferences()
{
    Preferences prefs;

    // Load device configuration
    prefs.begin("config", true);
    deviceConfig.deviceId = prefs.getUChar("deviceId", DEFAULT_DEVICE_ID);
    prefs.getString("deviceName", deviceConfig.deviceName, sizeof(deviceConfig.deviceName));
    prefs.end();

    // Load system data
    prefs.begin("system", true);
    deviceConfig.rebootCounter = prefs.getUInt("rebootCount", 0);
    prefs.end();

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        loadEndpoint(slot);
    }

    LOG_INFO("Preferences loaded successfully (device ID " + std::to_string(deviceConfig.deviceId) + ")");
}

void DeviceState::loadEndpoint(uint8_t slot)
{
    EndpointSettings &endpoint = endpoints[slot];
    SessionConfig &session = endpoint.session;

    Preferences prefs;
    prefs.begin(endpointNamespace(slot).c_str(), true);
    session.host = prefs.getString("host", "").c_str();
    session.port = prefs.getUShort("port", DEFAULT_PDU_PORT);
    session.username = prefs.getString("username", "").c_str();
    session.password = prefs.getString("password", "").c_str();
    session.prompt = prefs.getString("prompt", DEFAULT_PDU_PROMPT).c_str();
    session.connectOnStart = prefs.getBool("autoConnect", true);
    session.receiverAction = SessionConfig::receiverActionFromString(prefs.getString("receiver", "cycle").c_str());
    endpoint.mode = prefs.getUChar("mode", (uint8_t)OperationMode::CYCLE) == (uint8_t)OperationMode::ON_OFF
                        ? OperationMode::ON_OFF
                        : OperationMode::CYCLE;
    prefs.end();
}

void DeviceState::saveEndpoint(uint8_t slot)
{
    const EndpointSettings &endpoint = endpoints[slot];
    const SessionConfig &session = endpoint.session;

    Preferences prefs;
    if (!prefs.begin(endpointNamespace(slot).c_str(), false))
    {
        LOG_ERROR("Failed to open NVS preferences for " + std::string(slotTag(slot).c_str()));
        return;
    }
    prefs.putString("host", session.host.c_str());
    prefs.putUShort("port", session.port);
    prefs.putString("username", session.username.c_str());
    prefs.putString("password", session.password.c_str());
    prefs.putString("prompt", session.prompt.c_str());
    prefs.putBool("autoConnect", session.connectOnStart);
    prefs.putString("receiver", SessionConfig::receiverActionToString(session.receiverAction));
    prefs.putUChar("mode", (uint8_t)endpoint.mode);
    prefs.end();
}

void DeviceState::saveToPreferences()
{
    Preferences prefs;

    // Save device configuration
    prefs.begin("config", false);
    prefs.putUChar("deviceId", deviceConfig.deviceId);
    prefs.putString("deviceName", deviceConfig.deviceName);
    prefs.end();

    // Save system data
    prefs.begin("system", false);
    prefs.putUInt("rebootCount", deviceConfig.rebootCounter);
    prefs.end();

    for (uint8_t slot = 0; slot < MAX_ENDPOINTS; slot++)
    {
        saveEndpoint(slot);
    }
}

bool DeviceState::setDeviceId(uint8_t id)
{
    if (id < MIN_DEVICE_ID || id > MAX_DEVICE_ID)
    {
        LOG_WARNING("Device ID " + std::to_string(id) + " is outside valid range " +
                    std::to_string(MIN_DEVICE_ID) + "-" + std::to_string(MAX_DEVICE_ID));
        return false;
    }

    deviceConfig.deviceId = id;

    Preferences prefs;
    prefs.begin("config", false);
    prefs.putUChar("deviceId", id);
    prefs.end();

    LOG_INFO("Device ID set to " + std::to_string(id));
    return true;
}

void DeviceState::setDeviceName(const String &name)
{
    if (name.length() > 0 && name.length() < sizeof(deviceConfig.deviceName))
    {
        strncpy(deviceConfig.deviceName, name.c_str(), sizeof(deviceConfig.deviceName) - 1);
        deviceConfig.deviceName[sizeof(deviceConfig.deviceName) - 1] = '\0';

        Preferences prefs;
        prefs.begin("config", false);
        prefs.putString("deviceName", deviceConfig.deviceName);
        prefs.end();

        LOG_INFO("Device name set to: " + std::string(name.c_str()));
    }
}

void DeviceState::incrementRebootCounter()
{
    deviceConfig.rebootCounter++;
    Preferences prefs;
    prefs.begin("system", false);
    prefs.putUInt("rebootCount", deviceConfig.rebootCounter);
    prefs.end();
}

const EndpointSettings &DeviceState::getEndpoint(uint8_t slot)
{
    return endpoints[isValidSlot(slot) ? slot : 0];
}

bool DeviceState::setEndpoint(uint8_t slot, const SessionConfig &config, String &error)
{
    if (!isValidSlot(slot))
    {
        error = "Invalid endpoint slot " + String(slot + 1);
        return false;
    }

    SessionConfig updated = config;
    updated.tag = slotTag(slot).c_str();

    // An empty host parks the slot; anything else must be a usable endpoint
    std::string reason;
    if (updated.hasHost() && !updated.validate(reason))
    {
        error = reason.c_str();
        return false;
    }

    endpoints[slot].session = updated;
    saveEndpoint(slot);

    LOG_INFO("Endpoint " + updated.tag + " set to " + (updated.hasHost() ? updated.host : std::string("<none>")) +
             ":" + std::to_string(updated.port));
    return true;
}

void DeviceState::setOperationMode(uint8_t slot, OperationMode mode)
{
    if (!isValidSlot(slot) || endpoints[slot].mode == mode)
    {
        return;
    }
    endpoints[slot].mode = mode;

    Preferences prefs;
    prefs.begin(endpointNamespace(slot).c_str(), false);
    prefs.putUChar("mode", (uint8_t)mode);
    prefs.end();
}

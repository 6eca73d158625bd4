#pragma once

#include <Arduino.h>
#include <Preferences.h>
#include "config.h"
#include "control_panel.h"
#include "session_config.h"

// -------------------------------------------------------------------------
// Device State Management
// -------------------------------------------------------------------------
struct DeviceConfig
{
    uint8_t deviceId = DEFAULT_DEVICE_ID;
    char deviceName[MAX_DEVICE_NAME_LENGTH] = DEFAULT_DEVICE_NAME;
    uint32_t rebootCounter = 0;
};

struct EndpointSettings
{
    SessionConfig session;
    OperationMode mode = OperationMode::CYCLE;
};

class DeviceState
{
private:
    static DeviceConfig deviceConfig;
    static EndpointSettings endpoints[MAX_ENDPOINTS];
    static unsigned long bootTime;

    static String endpointNamespace(uint8_t slot);
    static void loadEndpoint(uint8_t slot);
    static void saveEndpoint(uint8_t slot);

public:
    static void init();
    static void loadFromPreferences();
    static void saveToPreferences();

    // Device Config
    static DeviceConfig &getDeviceConfig() { return deviceConfig; }
    static bool setDeviceId(uint8_t id);
    static void setDeviceName(const String &name);
    static void incrementRebootCounter();

    // PDU Endpoints (slot is 0-based)
    static bool isValidSlot(uint8_t slot) { return slot < MAX_ENDPOINTS; }
    static String slotTag(uint8_t slot);
    static const EndpointSettings &getEndpoint(uint8_t slot);
    static bool setEndpoint(uint8_t slot, const SessionConfig &config, String &error);
    static void setOperationMode(uint8_t slot, OperationMode mode);

    // System Info
    static void setBootTime(unsigned long time) { bootTime = time; }
    static unsigned long getBootTime() { return bootTime; }
};

#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include "config.h"

// -------------------------------------------------------------------------
// Control Panel
// -------------------------------------------------------------------------
// The state a UI renders for one PDU: outlet and group toggles, status,
// busy indicators, the confirm/cancel pair, sensor readouts and the
// operation mode. Indices are 1-based like the PDU's own numbering.

enum class StatusLevel : uint8_t
{
    OK = 0,
    COMPROMISED = 1,
    FAULT = 2,
    NOT_PRESENT = 3
};

enum class OperationMode : uint8_t
{
    ON_OFF = 1,
    CYCLE = 2
};

struct OutletControl
{
    std::string name;
    bool powered = false;
    bool known = false; // set once the PDU has reported this outlet
};

struct GroupControl
{
    std::string name = UNUSED_GROUP_LABEL;
    bool powered = false;
    bool unused = true;
};

struct SensorDisplay
{
    std::string current;     // "3.45 A"
    std::string activePower; // "22.10 W"
    std::string temperature; // "22.10 °C"
    std::string humidity;    // "45 %"
};

class ControlPanel
{
public:
    typedef std::function<void()> ChangeListener;

    ControlPanel();

    // Back to unknown / disabled, as after a disconnect. Keeps the mode.
    void reset();

    void setChangeListener(ChangeListener listener) { changeListener = listener; }

    // Outlets
    static bool isValidOutlet(uint32_t index) { return index >= 1 && index <= MAX_OUTLETS; }
    const OutletControl &getOutlet(uint8_t index) const;
    bool setOutletState(uint8_t index, bool powered);
    bool setOutletName(uint8_t index, const std::string &name);
    bool isOutletInputEnabled(uint8_t index) const;

    // Groups
    static bool isValidGroup(uint32_t index) { return index >= 1 && index <= MAX_GROUPS; }
    const GroupControl &getGroup(uint8_t index) const;
    bool setGroupState(uint8_t index, bool powered);
    bool setGroupName(uint8_t index, const std::string &name);
    bool markGroupUnused(uint8_t index);
    bool isGroupInputEnabled(uint8_t index) const;
    uint8_t findGroupByName(const std::string &name) const; // 0 when not found

    // Status
    void setStatus(const std::string &text, StatusLevel level);
    const std::string &getStatus() const { return status; }
    StatusLevel getStatusLevel() const { return statusLevel; }

    // Indicators
    void setProcessing(bool on);
    void setWaiting(bool on);
    void setConfirmEnabled(bool enabled);
    void setControlsLocked(bool locked);
    bool isProcessing() const { return processing; }
    bool isWaiting() const { return waiting; }
    bool isConfirmEnabled() const { return confirmEnabled; }
    bool areControlsLocked() const { return controlsLocked; }

    // Sensors
    SensorDisplay &sensors() { return sensorDisplay; }
    const SensorDisplay &sensors() const { return sensorDisplay; }

    // Operation mode (exactly one selected)
    void selectMode(OperationMode mode);
    void deselectMode(OperationMode mode);
    bool isModeSelected(OperationMode mode) const { return selectedMode == mode; }
    OperationMode getMode() const { return selectedMode; }

    void notifyChanged();

    static const char *statusLevelToString(StatusLevel level);
    static const char *modeToString(OperationMode mode);

private:
    OutletControl outlets[MAX_OUTLETS];
    GroupControl groups[MAX_GROUPS];
    SensorDisplay sensorDisplay;

    std::string status = "Disconnected";
    StatusLevel statusLevel = StatusLevel::NOT_PRESENT;

    bool processing = false;
    bool waiting = false;
    bool confirmEnabled = false;
    bool controlsLocked = true;

    OperationMode selectedMode = OperationMode::CYCLE;
    ChangeListener changeListener;
};

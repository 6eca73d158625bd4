#include "control_panel.h"
#include "logger.h"
#include "text_scanner.h"

ControlPanel::ControlPanel()
{
    reset();
}

void ControlPanel::reset()
{
    for (uint8_t i = 0; i < MAX_OUTLETS; i++)
    {
        outlets[i] = OutletControl();
        outlets[i].name = "Outlet " + std::to_string(i + 1);
    }
    for (uint8_t i = 0; i < MAX_GROUPS; i++)
    {
        groups[i] = GroupControl();
    }
    sensorDisplay = SensorDisplay();
    processing = false;
    waiting = false;
    confirmEnabled = false;
    controlsLocked = true;
    notifyChanged();
}

const OutletControl &ControlPanel::getOutlet(uint8_t index) const
{
    static const OutletControl none;
    return isValidOutlet(index) ? outlets[index - 1] : none;
}

bool ControlPanel::setOutletState(uint8_t index, bool powered)
{
    if (!isValidOutlet(index))
    {
        return false;
    }
    OutletControl &outlet = outlets[index - 1];
    bool changed = outlet.powered != powered || !outlet.known;
    outlet.powered = powered;
    outlet.known = true;
    if (changed)
    {
        notifyChanged();
    }
    return true;
}

bool ControlPanel::setOutletName(uint8_t index, const std::string &name)
{
    if (!isValidOutlet(index) || name.empty())
    {
        return false;
    }
    if (outlets[index - 1].name != name)
    {
        outlets[index - 1].name = name;
        notifyChanged();
    }
    return true;
}

bool ControlPanel::isOutletInputEnabled(uint8_t index) const
{
    return isValidOutlet(index) && !controlsLocked;
}

const GroupControl &ControlPanel::getGroup(uint8_t index) const
{
    static const GroupControl none;
    return isValidGroup(index) ? groups[index - 1] : none;
}

bool ControlPanel::setGroupState(uint8_t index, bool powered)
{
    if (!isValidGroup(index))
    {
        return false;
    }
    GroupControl &group = groups[index - 1];
    if (group.powered != powered || group.unused)
    {
        group.powered = powered;
        group.unused = false;
        notifyChanged();
    }
    return true;
}

bool ControlPanel::setGroupName(uint8_t index, const std::string &name)
{
    if (!isValidGroup(index) || name.empty())
    {
        return false;
    }
    if (groups[index - 1].name != name)
    {
        groups[index - 1].name = name;
        notifyChanged();
    }
    return true;
}

bool ControlPanel::markGroupUnused(uint8_t index)
{
    if (!isValidGroup(index))
    {
        return false;
    }
    GroupControl &group = groups[index - 1];
    if (!group.unused || group.powered || group.name != UNUSED_GROUP_LABEL)
    {
        group.unused = true;
        group.powered = false;
        group.name = UNUSED_GROUP_LABEL;
        notifyChanged();
    }
    return true;
}

bool ControlPanel::isGroupInputEnabled(uint8_t index) const
{
    return isValidGroup(index) && !controlsLocked && !groups[index - 1].unused;
}

uint8_t ControlPanel::findGroupByName(const std::string &name) const
{
    std::string wanted = TextScanner::toLower(TextScanner::trim(name));
    if (wanted.empty())
    {
        return 0;
    }
    for (uint8_t i = 0; i < MAX_GROUPS; i++)
    {
        if (!groups[i].unused && TextScanner::toLower(groups[i].name) == wanted)
        {
            return i + 1;
        }
    }
    return 0;
}

void ControlPanel::setStatus(const std::string &text, StatusLevel level)
{
    if (status != text || statusLevel != level)
    {
        status = text;
        statusLevel = level;
        notifyChanged();
    }
}

void ControlPanel::setProcessing(bool on)
{
    if (processing != on)
    {
        processing = on;
        notifyChanged();
    }
}

void ControlPanel::setWaiting(bool on)
{
    if (waiting != on)
    {
        waiting = on;
        notifyChanged();
    }
}

void ControlPanel::setConfirmEnabled(bool enabled)
{
    if (confirmEnabled != enabled)
    {
        confirmEnabled = enabled;
        notifyChanged();
    }
}

void ControlPanel::setControlsLocked(bool locked)
{
    if (controlsLocked != locked)
    {
        controlsLocked = locked;
        notifyChanged();
    }
}

void ControlPanel::selectMode(OperationMode mode)
{
    if (selectedMode != mode)
    {
        selectedMode = mode;
        LOG_INFO("Power operation mode changed to: " + std::string(modeToString(mode)));
        notifyChanged();
    }
}

void ControlPanel::deselectMode(OperationMode mode)
{
    // Exactly one mode stays selected; deselecting the current one is refused
    if (selectedMode == mode)
    {
        LOG_DEBUG("Prevented deselection of power operation mode " + std::string(modeToString(mode)));
        notifyChanged();
    }
}

void ControlPanel::notifyChanged()
{
    if (changeListener)
    {
        changeListener();
    }
}

const char *ControlPanel::statusLevelToString(StatusLevel level)
{
    switch (level)
    {
    case StatusLevel::OK:
        return "OK";
    case StatusLevel::COMPROMISED:
        return "COMPROMISED";
    case StatusLevel::FAULT:
        return "FAULT";
    case StatusLevel::NOT_PRESENT:
        return "NOT_PRESENT";
    default:
        return "UNKNOWN";
    }
}

const char *ControlPanel::modeToString(OperationMode mode)
{
    return mode == OperationMode::ON_OFF ? "OnOff" : "Cycle";
}

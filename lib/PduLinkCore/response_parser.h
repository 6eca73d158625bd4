#pragma once

#include <stdint.h>
#include <string>
#include <vector>
#include "control_panel.h"

// -------------------------------------------------------------------------
// Response Parser
// -------------------------------------------------------------------------
// Field extractors for complete, prompt-terminated CLI output. Each field
// is independent: a line that does not match is skipped and the rest of
// the response is still read.
//
//   RMS Current: 3.45 A
//   Reading: 22.10 W | Reading: 22.10 deg C | Reading: 45 %
//   Outlet 3 - Server Rack: Power state: On
//   Outlet Group 2 - Network:  ...  State: 3 on 1 off
//       Outlet 5 - Switch: On          (member lines inside a group block)

struct SensorReadings
{
    bool hasCurrent = false;
    bool hasActivePower = false;
    bool hasTemperature = false;
    bool hasHumidity = false;
    std::string current;
    std::string activePower;
    std::string temperature;
    std::string humidity;
};

struct OutletReading
{
    uint8_t index;
    std::string name;
    bool powered;
};

struct GroupReading
{
    uint8_t index;
    std::string name;
    uint32_t onCount;
    uint32_t offCount;
    bool powered; // every member on, and at least one member
};

struct MemberReading
{
    uint8_t outlet;
    bool powered;
};

struct ParsedResponse
{
    SensorReadings sensors;
    std::vector<OutletReading> outlets;
    bool isGroupListing = false;
    bool isCompleteListing = false; // "show outletgroups" echo seen; absent groups are unused
    std::vector<GroupReading> groups;
    std::vector<MemberReading> members;
};

struct ApplyContext
{
    bool groupOperationInFlight = false; // member lines are authoritative
    bool revertingState = false;         // toggles must not be overwritten
};

class ResponseParser
{
public:
    static ParsedResponse parse(const std::string &response);

    // Writes parsed values into the panel; returns the number of toggles touched
    static uint32_t apply(const ParsedResponse &parsed, ControlPanel &panel, const ApplyContext &context);

    static void parseSensors(const std::string &response, SensorReadings &sensors);
    static void parseOutletLines(const std::string &response, std::vector<OutletReading> &outlets);
    static bool parseGroupListing(const std::string &response, std::vector<GroupReading> &groups,
                                  std::vector<MemberReading> &members);

    static bool isGroupPowered(uint32_t onCount, uint32_t offCount) { return offCount == 0 && onCount > 0; }

private:
    static void parseGroupSummary(const std::string &summary, uint32_t &onCount, uint32_t &offCount);
};

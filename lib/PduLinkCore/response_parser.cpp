#include "response_parser.h"
#include "logger.h"
#include "text_scanner.h"

// ---------------------------------------------------------------------------
// Parse
// ---------------------------------------------------------------------------

ParsedResponse ResponseParser::parse(const std::string &response)
{
    ParsedResponse parsed;
    parseSensors(response, parsed.sensors);
    parseOutletLines(response, parsed.outlets);
    parsed.isGroupListing = parseGroupListing(response, parsed.groups, parsed.members);
    parsed.isCompleteListing = response.find("show outletgroups") != std::string::npos;
    return parsed;
}

void ResponseParser::parseSensors(const std::string &response, SensorReadings &sensors)
{
    // RMS Current: <n> A
    TextScanner current(response);
    while (!sensors.hasCurrent && current.seek("RMS Current:"))
    {
        current.accept("RMS Current:");
        current.skipSpaces();
        std::string value;
        if (!current.readDecimal(value))
        {
            continue;
        }
        current.skipSpaces();
        if (current.acceptChar('A'))
        {
            sensors.current = value + " A";
            sensors.hasCurrent = true;
        }
    }

    // Reading: <n> <unit>, first match per unit wins
    TextScanner reading(response);
    while (reading.seek("Reading:"))
    {
        reading.accept("Reading:");
        reading.skipSpaces();
        std::string value;
        if (!reading.readDecimal(value))
        {
            continue;
        }
        reading.skipSpaces();

        if (reading.startsWith("W"))
        {
            if (!sensors.hasActivePower)
            {
                sensors.activePower = value + " W";
                sensors.hasActivePower = true;
            }
        }
        else if (reading.startsWith("deg C"))
        {
            if (!sensors.hasTemperature)
            {
                sensors.temperature = value + " \xC2\xB0" "C";
                sensors.hasTemperature = true;
            }
        }
        else if (reading.startsWith("%"))
        {
            if (!sensors.hasHumidity)
            {
                sensors.humidity = value + " %";
                sensors.hasHumidity = true;
            }
        }
        else
        {
            LOG_DEBUG("Unrecognized reading unit after value " + value);
        }
    }
}

void ResponseParser::parseOutletLines(const std::string &response, std::vector<OutletReading> &outlets)
{
    TextScanner scanner(response);
    while (scanner.seek("Outlet"))
    {
        scanner.accept("Outlet");
        size_t resume = scanner.position();

        // "Outlet<sp>*<n><sp>*[-]<sp>*<name>:<sp>*Power state:<sp>*<word>"
        scanner.skipSpaces();
        uint32_t index = 0;
        if (!scanner.readUnsigned(index))
        {
            continue;
        }
        scanner.skipSpaces();
        scanner.acceptChar('-');
        scanner.skipSpaces();
        std::string name = TextScanner::trim(scanner.readUntilAny(":\r\n"));
        if (!scanner.acceptChar(':'))
        {
            scanner.setPosition(resume);
            continue;
        }
        scanner.skipSpaces();
        if (!scanner.accept("Power state:"))
        {
            scanner.setPosition(resume);
            continue;
        }
        scanner.skipSpaces();
        std::string state;
        if (!scanner.readWord(state))
        {
            continue;
        }

        if (!ControlPanel::isValidOutlet(index))
        {
            LOG_DEBUG("Ignoring outlet index out of range: " + std::to_string(index));
            continue;
        }
        outlets.push_back(OutletReading{(uint8_t)index, name, state == "On"});
    }
}

void ResponseParser::parseGroupSummary(const std::string &summary, uint32_t &onCount, uint32_t &offCount)
{
    onCount = 0;
    offCount = 0;

    TextScanner scanner(summary);
    while (!scanner.atEnd())
    {
        uint32_t count = 0;
        if (!scanner.readUnsigned(count))
        {
            scanner.setPosition(scanner.position() + 1);
            continue;
        }
        if (scanner.accept(" on"))
        {
            onCount = count;
        }
        else if (scanner.accept(" off"))
        {
            offCount = count;
        }
    }
}

bool ResponseParser::parseGroupListing(const std::string &response, std::vector<GroupReading> &groups,
                                       std::vector<MemberReading> &members)
{
    static const std::string HEADER = "Outlet Group ";

    bool listing = response.find("show outletgroups") != std::string::npos;

    size_t headerPos = response.find(HEADER);
    if (headerPos != std::string::npos)
    {
        listing = true;
    }

    while (headerPos != std::string::npos)
    {
        size_t nextHeader = response.find(HEADER, headerPos + HEADER.size());
        size_t blockEnd = nextHeader == std::string::npos ? response.size() : nextHeader;

        TextScanner block(response, headerPos + HEADER.size(), blockEnd);
        uint32_t index = 0;
        if (!block.readUnsigned(index) || !block.accept(" - "))
        {
            headerPos = nextHeader;
            continue;
        }

        // "Name:" on its own line, or "Name  State: ..." on one line
        size_t nameStart = block.position();
        std::string rawName = block.readUntilAny(":\r\n");
        size_t stateAt = rawName.find("State");
        if (stateAt != std::string::npos)
        {
            rawName = rawName.substr(0, stateAt);
            block.setPosition(nameStart + stateAt);
        }
        std::string name = TextScanner::trim(rawName);

        if (name.empty() || !block.seek("State:"))
        {
            LOG_DEBUG("Incomplete group block for group " + std::to_string(index));
            headerPos = nextHeader;
            continue;
        }
        block.accept("State:");
        block.skipSpaces();
        std::string summary = block.readUntilAny("\r\n");

        uint32_t onCount = 0;
        uint32_t offCount = 0;
        parseGroupSummary(summary, onCount, offCount);

        if (ControlPanel::isValidGroup(index))
        {
            groups.push_back(GroupReading{(uint8_t)index, name, onCount, offCount, isGroupPowered(onCount, offCount)});
        }
        else
        {
            LOG_DEBUG("Ignoring group index out of range: " + std::to_string(index));
        }

        // Member lines: "Outlet <n>[ - name]: On|Off"
        while (block.seek("Outlet "))
        {
            block.accept("Outlet ");
            uint32_t outlet = 0;
            if (!block.readUnsigned(outlet))
            {
                continue;
            }
            block.readUntilAny(":\r\n");
            if (!block.acceptChar(':'))
            {
                continue;
            }
            block.skipSpaces();
            std::string state;
            if (!block.readWord(state))
            {
                continue;
            }
            if ((state == "On" || state == "Off") && ControlPanel::isValidOutlet(outlet))
            {
                members.push_back(MemberReading{(uint8_t)outlet, state == "On"});
            }
        }

        headerPos = nextHeader;
    }

    return listing;
}

// ---------------------------------------------------------------------------
// Apply
// ---------------------------------------------------------------------------

uint32_t ResponseParser::apply(const ParsedResponse &parsed, ControlPanel &panel, const ApplyContext &context)
{
    uint32_t touched = 0;

    const SensorReadings &sensors = parsed.sensors;
    SensorDisplay &display = panel.sensors();
    bool sensorsChanged = false;
    if (sensors.hasCurrent && display.current != sensors.current)
    {
        display.current = sensors.current;
        sensorsChanged = true;
    }
    if (sensors.hasActivePower && display.activePower != sensors.activePower)
    {
        display.activePower = sensors.activePower;
        sensorsChanged = true;
    }
    if (sensors.hasTemperature && display.temperature != sensors.temperature)
    {
        display.temperature = sensors.temperature;
        sensorsChanged = true;
    }
    if (sensors.hasHumidity && display.humidity != sensors.humidity)
    {
        display.humidity = sensors.humidity;
        sensorsChanged = true;
    }
    if (sensorsChanged)
    {
        panel.notifyChanged();
    }

    for (const auto &outlet : parsed.outlets)
    {
        if (context.revertingState)
        {
            LOG_DEBUG("Skipping outlet " + std::to_string(outlet.index) + " update - state reversion in progress");
            continue;
        }
        panel.setOutletState(outlet.index, outlet.powered);
        panel.setOutletName(outlet.index, outlet.name);
        touched++;
    }

    if (!parsed.isGroupListing)
    {
        return touched;
    }

    bool present[MAX_GROUPS + 1] = {false};
    for (const auto &group : parsed.groups)
    {
        present[group.index] = true;
        if (context.revertingState)
        {
            LOG_DEBUG("Skipping group " + std::to_string(group.index) + " update - state reversion in progress");
            continue;
        }
        panel.setGroupState(group.index, group.powered);
        panel.setGroupName(group.index, group.name);
        touched++;
    }

    if (context.groupOperationInFlight && !context.revertingState)
    {
        for (const auto &member : parsed.members)
        {
            panel.setOutletState(member.outlet, member.powered);
            touched++;
        }
    }

    if (!parsed.isCompleteListing)
    {
        return touched;
    }

    for (uint8_t i = 1; i <= MAX_GROUPS; i++)
    {
        if (!present[i])
        {
            panel.markGroupUnused(i);
        }
    }

    return touched;
}

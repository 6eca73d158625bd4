#include "session_config.h"
#include "text_scanner.h"

bool SessionConfig::isValidIPv4(const std::string &address)
{
    TextScanner scanner(address);
    for (int octet = 0; octet < 4; octet++)
    {
        if (octet > 0 && !scanner.acceptChar('.'))
        {
            return false;
        }
        size_t start = scanner.position();
        uint32_t value = 0;
        if (!scanner.readUnsigned(value) || value > 255 || scanner.position() - start > 3)
        {
            return false;
        }
    }
    return scanner.atEnd();
}

bool SessionConfig::validate(std::string &reason) const
{
    if (tag.empty())
    {
        reason = "Empty session tag";
        return false;
    }
    if (!isValidIPv4(host))
    {
        reason = "Invalid IP address: " + host;
        return false;
    }
    if (!isValidPort(port))
    {
        reason = "Invalid port number: " + std::to_string(port);
        return false;
    }
    if (prompt.empty())
    {
        reason = "Empty shell prompt";
        return false;
    }
    return true;
}

const char *SessionConfig::receiverActionToString(ReceiverAction action)
{
    return action == ReceiverAction::POWER_ON ? "on" : "cycle";
}

ReceiverAction SessionConfig::receiverActionFromString(const std::string &value)
{
    return TextScanner::toLower(value) == "on" ? ReceiverAction::POWER_ON : ReceiverAction::CYCLE;
}

/**
 * TestCase: Test_SessionConfig
 *
 * Goal:
 *   Endpoint validation before any connection attempt.
 */

#include <string>
#include "TestBench.h"
#include "TestCase.h"
#include "session_config.h"

class Test_SessionConfig : public BasicTestCase
{
public:
    const char *name() const override { return "Config: endpoint validation"; }

protected:
    void run() override
    {
        check(SessionConfig::isValidIPv4("192.168.1.50"), "valid address rejected");
        check(SessionConfig::isValidIPv4("10.0.0.1"), "valid address rejected");
        check(!SessionConfig::isValidIPv4(""), "empty address accepted");
        check(!SessionConfig::isValidIPv4("256.1.1.1"), "octet above 255 accepted");
        check(!SessionConfig::isValidIPv4("1.2.3"), "three octets accepted");
        check(!SessionConfig::isValidIPv4("1.2.3.4.5"), "five octets accepted");
        check(!SessionConfig::isValidIPv4("pdu.local"), "host name accepted");
        check(!SessionConfig::isValidIPv4("1234.1.1.1"), "four-digit octet accepted");
        check(!SessionConfig::isValidIPv4("1.2.3.4 "), "trailing space accepted");

        check(SessionConfig::isValidPort(23) && SessionConfig::isValidPort(65535), "valid port rejected");
        check(!SessionConfig::isValidPort(0) && !SessionConfig::isValidPort(65536), "invalid port accepted");

        SessionConfig config = TestBench::makeConfig("pdu1");
        std::string reason;
        check(config.validate(reason), "valid config rejected: " + reason);

        SessionConfig noHost = config;
        noHost.host.clear();
        check(!noHost.validate(reason) && reason.find("Invalid IP address") == 0, "missing host: " + reason);

        SessionConfig badPort = config;
        badPort.port = 0;
        check(!badPort.validate(reason) && reason == "Invalid port number: 0", "bad port: " + reason);

        SessionConfig noPrompt = config;
        noPrompt.prompt.clear();
        check(!noPrompt.validate(reason), "empty prompt accepted");

        check(SessionConfig::receiverActionFromString("ON") == ReceiverAction::POWER_ON, "'ON' receiver action");
        check(SessionConfig::receiverActionFromString("cycle") == ReceiverAction::CYCLE, "'cycle' receiver action");
        check(SessionConfig::receiverActionFromString("bogus") == ReceiverAction::CYCLE, "unknown receiver action");
        check(std::string(SessionConfig::receiverActionToString(ReceiverAction::POWER_ON)) == "on", "receiver action name");

        // An invalid endpoint never reaches the transport
        TestBench bench;
        SessionConfig invalid = config;
        invalid.host = "300.1.1.1";
        BenchEndpoint &pdu = bench.add(invalid);
        check(!pdu.session->connect(true), "connect to an invalid address initiated");
        check(pdu.transport.connectCalls == 0, "invalid address reached the transport");

        // Auto-connect shortly after begin() when configured
        SessionConfig automatic = TestBench::makeConfig("pdu2", "10.0.0.20");
        automatic.connectOnStart = true;
        BenchEndpoint &autoPdu = bench.add(automatic);
        check(autoPdu.transport.connectCalls == 0, "auto-connect ran inside begin()");
        bench.advance(AUTO_CONNECT_DELAY_MS);
        check(autoPdu.transport.connectCalls == 1, "auto-connect did not run");
        check(autoPdu.transport.lastHost == "10.0.0.20", "auto-connect endpoint");
    }
};

ITestCase *get_test_session_config()
{
    static Test_SessionConfig inst;
    return &inst;
}

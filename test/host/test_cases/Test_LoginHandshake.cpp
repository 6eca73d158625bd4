/**
 * TestCase: Test_LoginHandshake
 *
 * Goal:
 *   Telnet login driven purely by markers in the inbound stream.
 *
 * Expected behavior:
 *   - "Username:" clears the buffer at once and the username follows
 *     500 ms later, the password 1 s after "Password:".
 *   - "Welcome" unlocks the panel and the first poll batch goes out 5 s
 *     later, one command at a time.
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_LoginHandshake : public BasicTestCase
{
public:
    const char *name() const override { return "Session: login pacing and first poll"; }

protected:
    void run() override
    {
        TestBench bench;
        BenchEndpoint &pdu = bench.add(TestBench::makeConfig("pdu1"));
        PduSession &session = *pdu.session;

        check(session.getPanel().getStatus() == "Disconnected", "initial status");
        check(session.getPanel().areControlsLocked(), "controls unlocked before login");

        check(session.connect(true), "connect not initiated");
        check(pdu.transport.connectCalls == 1, "transport connect calls");
        check(pdu.transport.lastHost == "10.0.0.10" && pdu.transport.lastPort == 23, "connect endpoint");

        pdu.transport.completeConnect();
        check(session.getFlags().connected && session.getPanel().getStatus() == "Connected", "connected state");

        pdu.transport.feed("\r\nUsername: ");
        check(session.getFramer().empty(), "buffer not cleared on username prompt");
        check(pdu.transport.writes.empty(), "username sent without pacing delay");
        bench.advance(USERNAME_SEND_DELAY_MS - 10);
        check(pdu.transport.writes.empty(), "username sent early");
        bench.advance(10);
        check(pdu.transport.writes.size() == 1 && pdu.transport.lastWrite() == "admin\r\n",
              "exactly one username write expected");

        pdu.transport.feed("Password: ");
        check(session.getFramer().empty(), "buffer not cleared on password prompt");
        bench.advance(PASSWORD_SEND_DELAY_MS - 10);
        check(pdu.transport.writes.size() == 1, "password sent early");
        bench.advance(10);
        check(pdu.transport.lastWrite() == "secret\r\n", "password write");

        pdu.transport.feed("\r\nWelcome to the PDU command line\r\n[My PDU] #");
        check(session.getFlags().authenticated, "not authenticated after welcome");
        check(session.getPanel().getStatus() == "Logged In", "status after welcome");
        check(!session.getPanel().areControlsLocked(), "controls still locked after login");
        check(session.getPoller().isActive(), "polling not started");

        bench.advance(FIRST_POLL_DELAY_MS - 10);
        check(pdu.transport.writes.size() == 2, "polled before the first-poll delay");
        bench.advance(10);
        check(pdu.transport.lastWrite() == "show inlets\r\n", "first poll command");
        check(pdu.transport.writes.size() == 3, "more than one poll command outstanding");

        bench.respond(pdu, TestBench::cannedResponse("show inlets"));
        check(session.getPanel().sensors().current == "3.45 A", "inlet current not shown");
        check(pdu.transport.lastWrite() == "show sensor externalsensor 1\r\n", "next poll command after response");

        // Prompt split across two chunks
        pdu.transport.feed("show sensor externalsensor 1\r\n  Reading: 22.10 deg C\r\n[My P");
        check(pdu.transport.writes.size() == 4, "partial prompt completed the command");
        pdu.transport.feed("DU] #");
        check(pdu.transport.writes.size() == 5, "split prompt not recognised");
        check(session.getPerformance().responsesReceived == 2, "responses counter");
    }
};

ITestCase *get_test_login_handshake()
{
    static Test_LoginHandshake inst;
    return &inst;
}

/**
 * TestCase: Test_ConnectionLoss
 *
 * Goal:
 *   Losing the link mid-arm reverts the armed toggle, reports the loss and
 *   reconnects while Connect is on. Disconnect resets the panel.
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_ConnectionLoss : public BasicTestCase
{
public:
    const char *name() const override { return "Session: link loss, reconnect, disconnect"; }

protected:
    void run() override
    {
        TestBench bench;
        BenchEndpoint &pdu = bench.add(TestBench::makeConfig("pdu1"));
        PduSession &session = *pdu.session;
        if (!check(bench.loginWithGroups(pdu), "login failed"))
        {
            return;
        }
        session.selectMode(OperationMode::ON_OFF);
        session.toggleOutlet(3);

        pdu.transport.drop();
        check(!session.getPanel().getOutlet(3).powered, "armed toggle not reverted on link loss");
        check(!session.getConfirmations().isArmed(), "command still armed on a dead link");
        check(session.getPanel().getStatus() == "Socket Closed", "status: " + session.getPanel().getStatus());
        check(session.getPanel().getStatusLevel() == StatusLevel::FAULT, "status level on link loss");
        check(!session.getFlags().connected && !session.getFlags().authenticated, "link flags");
        check(!session.getPoller().isActive(), "polling kept running without a link");
        check(session.getErrors().connectionErrors == 1, "connection error not counted");
        if (!check(session.getReconnect().isPending(), "reconnect not scheduled"))
        {
            return;
        }
        check(!session.toggleOutlet(1), "command armed without a link");

        bench.advance(session.getReconnect().getLastDelay());
        check(pdu.transport.connectCalls == 2, "reconnect attempt did not reach the transport");

        pdu.transport.completeConnect();
        pdu.transport.feed("Username: ");
        bench.advance(USERNAME_SEND_DELAY_MS);
        pdu.transport.feed("Password: ");
        bench.advance(PASSWORD_SEND_DELAY_MS);
        pdu.transport.feed("Welcome\r\n[My PDU] #");
        check(session.getFlags().authenticated, "login after reconnect");
        check(session.getReconnect().getAttempts() == 0, "reconnect attempts not reset after login");

        size_t disconnects = pdu.transport.disconnectCalls;
        check(session.connect(false), "disconnect refused");
        check(pdu.transport.disconnectCalls == disconnects + 1, "transport not closed");
        check(session.getPanel().getStatus() == "Disconnected", "status after disconnect");
        check(!session.getPanel().getOutlet(1).known, "panel not reset on disconnect");
        check(session.getPanel().getMode() == OperationMode::ON_OFF, "disconnect reset the mode");
        check(!session.getFlags().stayConnected, "still asking to stay connected");

        bench.advance(120000);
        check(pdu.transport.connectCalls == 2, "reconnected after a user disconnect");
    }
};

ITestCase *get_test_connection_loss()
{
    static Test_ConnectionLoss inst;
    return &inst;
}

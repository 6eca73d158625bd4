/**
 * TestCase: Test_RevertGuard
 *
 * Goal:
 *   A user command the PDU never answers is reverted, and for 10 s after
 *   the revert no response may overwrite the restored toggles.
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_RevertGuard : public BasicTestCase
{
public:
    const char *name() const override { return "Session: revert after retries, revert guard"; }

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
        check(session.confirm(), "confirm refused");
        check(pdu.transport.lastWrite() == "power outlets 3 on\r\n", "confirmed command");

        // Never answered: sent at 0, 11 s and 22 s, abandoned at 32 s
        bench.advance(31990);
        check(pdu.transport.countWrites("power outlets 3 on\r\n") == 3, "user command retries");
        check(session.getPanel().getOutlet(3).powered, "reverted before the retry budget ran out");
        check(!session.getFlags().revertingState, "revert guard raised early");

        bench.advance(10);
        check(!session.getPanel().getOutlet(3).powered, "outlet not reverted after retries");
        check(session.getFlags().revertingState, "revert guard not raised");
        check(!session.getQueue().isAwaitingResponse(), "abandoned command still outstanding");
        check(!session.getCurrentOperation().isValid(), "operation record kept after revert");
        check(!session.getFlags().userInitiatedCommand && !session.getPanel().isWaiting(), "transient state kept");
        check(session.isBusy(), "session idle while the revert guard is up");

        // A late status report is ignored while the guard is up
        pdu.transport.feed("Outlet 3 - Desk: Power state: On\r\n[My PDU] #");
        check(!session.getPanel().getOutlet(3).powered, "status overwrote a reverted toggle");

        bench.advance(REVERT_GUARD_MS);
        check(!session.getFlags().revertingState, "revert guard not lowered");
        pdu.transport.feed("Outlet 3 - Desk: Power state: On\r\n[My PDU] #");
        check(session.getPanel().getOutlet(3).powered, "status ignored after the guard");
    }
};

ITestCase *get_test_revert_guard()
{
    static Test_RevertGuard inst;
    return &inst;
}

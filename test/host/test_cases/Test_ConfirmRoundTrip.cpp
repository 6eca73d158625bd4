/**
 * TestCase: Test_ConfirmRoundTrip
 *
 * Goal:
 *   A confirmed user command from button press to refreshed panel.
 *
 * Expected behavior:
 *   - confirm() writes the armed command and shows processing.
 *   - The PDU's own "Do you wish to continue?" for that command is
 *     answered with "y" without asking the user again.
 *   - The response clears processing, waiting and the user flags.
 *   - The status refresh queries follow 3 s and 4 s after confirm.
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_ConfirmRoundTrip : public BasicTestCase
{
public:
    const char *name() const override { return "Confirm: execute, auto-answer, refresh"; }

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
        size_t outletQueries = pdu.transport.countWrites("show outlets\r\n");
        size_t groupQueries = pdu.transport.countWrites("show outletgroups\r\n");

        check(session.toggleOutlet(3), "toggle not armed");
        check(session.confirm(), "confirm refused");
        check(pdu.transport.lastWrite() == "power outlets 3 on\r\n", "confirmed command: " + pdu.transport.lastWrite());
        check(session.getFlags().processing && session.getPanel().isProcessing(), "processing not shown");
        check(session.getFlags().userInitiatedCommand, "user command flag");
        check(session.getFlags().waitingForUserConfirmation, "user confirmation must stay set until the response");
        check(!session.getPanel().isConfirmEnabled(), "confirm still offered after confirm");
        check(session.getCurrentOperation().kind == CommandKind::OUTLET_TOGGLE &&
                  session.getCurrentOperation().index == 3 && !session.getCurrentOperation().priorState,
              "operation record for revert");

        pdu.transport.feed("power outlets 3 on\r\nDo you wish to continue? [y/n] ");
        check(pdu.transport.lastWrite() == "y\r\n", "PDU prompt not auto-answered");
        check(!session.getFlags().serverConfirmationPending, "PDU prompt surfaced to the user");

        bench.respond(pdu, "Outlet 3 - Desk: Power state: On");
        check(session.getPanel().getOutlet(3).powered, "response state not applied");
        check(!session.getFlags().processing && !session.getPanel().isProcessing(), "processing not cleared");
        check(!session.getPanel().isWaiting(), "waiting not cleared");
        check(!session.getFlags().userInitiatedCommand, "user command flag not cleared");
        check(!session.getFlags().waitingForUserConfirmation, "user confirmation flag not cleared");
        check(!session.getCurrentOperation().isValid(), "operation record not cleared");
        check(!session.getPanel().areControlsLocked(), "controls left locked");

        // Refresh: "show outlets" 3 s after confirm, "show outletgroups" 1 s later
        bench.advance(2990);
        check(pdu.transport.countWrites("show outlets\r\n") == outletQueries, "refresh sent early");
        bench.advance(10);
        check(pdu.transport.countWrites("show outlets\r\n") == outletQueries + 1, "outlet refresh not sent");
        bench.answer(pdu);
        bench.advance(1000);
        check(pdu.transport.countWrites("show outletgroups\r\n") == groupQueries + 1, "group refresh not sent");
        bench.answer(pdu);

        check(session.getPanel().getOutlet(3).powered == false, "refresh did not report the canned outlet state");
        check(!session.isBusy(), "session busy after the round trip");
    }
};

ITestCase *get_test_confirm_round_trip()
{
    static Test_ConfirmRoundTrip inst;
    return &inst;
}

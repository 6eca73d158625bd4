/**
 * TestCase: Test_BroadcastDeferral
 *
 * Goal:
 *   A broadcast receiver must not push aside the user's own command on
 *   that PDU.
 *
 * Expected behavior:
 *   - A confirmed command held behind an outstanding poll is still sent
 *     exactly once when a peer cycle settles; the receiver's cycle follows
 *     it.
 *   - While a command is armed the receiver waits; once the user cancels,
 *     the receiver cycles and the cancelled command is never sent.
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_BroadcastDeferral : public BasicTestCase
{
public:
    const char *name() const override { return "Broadcast: receiver waits for user commands"; }

protected:
    void run() override
    {
        TestBench bench;
        BenchEndpoint &pduA = bench.add(TestBench::makeConfig("pduA", "10.0.0.10"));
        BenchEndpoint &pduB = bench.add(TestBench::makeConfig("pduB", "10.0.0.11"));
        PduSession &initiator = *pduA.session;
        PduSession &receiver = *pduB.session;
        if (!check(bench.loginWithGroups(pduA) && bench.loginWithGroups(pduB), "login failed"))
        {
            return;
        }
        receiver.selectMode(OperationMode::ON_OFF);

        // Next poll on B goes out and stays unanswered
        bench.advance(POLL_INTERVAL_MS + 100);
        bench.answer(pduA);
        if (!check(receiver.getQueue().isAwaitingResponse(), "no poll outstanding on B"))
        {
            return;
        }

        const std::string userCommand = "power outlets 1 off\r\n";
        const std::string cycle = "power outletgroup 2 cycle\r\n";
        check(receiver.toggleOutlet(1), "arming outlet 1 refused");
        check(receiver.confirm(), "confirm refused");
        check(pduB.transport.countWrites(userCommand) == 0, "user command jumped the outstanding poll");

        check(initiator.triggerGroupByName("Radios"), "trigger refused");
        bench.advance(BROADCAST_SETTLE_MS + BROADCAST_CHECK_INTERVAL_MS);
        check(receiver.getBroadcast().isProcessing(), "receiver gave up while the user command was queued");
        check(pduB.transport.countWrites(cycle) == 0, "receiver cycled ahead of the user command");

        // Poll response lands, the user command goes out and completes
        bench.respond(pduB, TestBench::cannedResponse(receiver.getQueue().getOutstanding().text));
        check(pduB.transport.lastWrite() == userCommand, "user command not sent after the poll: " + pduB.transport.lastWrite());
        bench.answer(pduB);
        bench.advance(BROADCAST_CHECK_INTERVAL_MS);
        bench.answer(pduB);

        check(pduB.transport.countWrites(userCommand) == 1, "user command not written exactly once");
        check(pduB.transport.countWrites(cycle) == 1, "receiver did not cycle after the user command");
        check(!receiver.getBroadcast().isProcessing(), "receiver still processing after its cycle");

        // Second round: an armed command holds the receiver until cancelled
        bench.answer(pduA);
        bench.advance(REFRESH_SETTLE_MS);
        bench.answer(pduA);
        bench.answer(pduB);
        if (!check(!initiator.getBroadcast().isProcessing(), "initiator still busy"))
        {
            return;
        }

        const std::string armed = "power outlets 3 on\r\n";
        check(receiver.toggleOutlet(3), "arming outlet 3 refused");
        check(initiator.triggerGroupByName("Radios"), "second trigger refused");
        bench.advance(BROADCAST_SETTLE_MS + BROADCAST_CHECK_INTERVAL_MS);
        check(pduB.transport.countWrites(cycle) == 1, "receiver cycled while a command was armed");
        check(receiver.getBroadcast().isProcessing(), "receiver dropped the broadcast while a command was armed");

        check(receiver.cancel(), "cancel refused");
        bench.advance(BROADCAST_CHECK_INTERVAL_MS);
        check(pduB.transport.countWrites(cycle) == 2, "receiver did not cycle after the cancel");
        check(pduB.transport.countWrites(armed) == 0, "cancelled command was sent");
    }

private:
    // Long enough for the refresh sequence after a confirm to run out
    static constexpr uint32_t REFRESH_SETTLE_MS = 12000;
};

ITestCase *get_test_broadcast_deferral()
{
    static Test_BroadcastDeferral inst;
    return &inst;
}

/**
 * TestCase: Test_TriggerGroupByName
 *
 * Goal:
 *   Name-triggered group cycles and the polling behaviour around them.
 *
 * Expected behavior:
 *   - Lookup is case-insensitive; empty or unknown names are refused.
 *   - The cycle is sent at once with a 20 s response window and is
 *     broadcast to peers.
 *   - A second trigger is refused while the broadcast is active.
 *   - For 30 s after the response, polls leave out "show outlets".
 */

#include "TestBench.h"
#include "TestCase.h"

class Test_TriggerGroupByName : public BasicTestCase
{
public:
    const char *name() const override { return "Session: group trigger by name, cooldown polls"; }

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

        uint32_t published = 0;
        bench.channel.subscribe([&](const BroadcastMessage &message)
                                {
                                    if (!message.cancel && message.groupName == "Radios" && message.originId == "pdu1")
                                    {
                                        published++;
                                    } });

        check(!session.triggerGroupByName(""), "empty name accepted");
        check(!session.triggerGroupByName("Amplifiers"), "unknown group accepted");
        check(!session.triggerGroupByName("Unused Group"), "unused group accepted");

        const std::string command = "power outletgroup 2 cycle\r\n";
        check(session.triggerGroupByName("rAdIoS"), "case-insensitive trigger refused");
        check(pdu.transport.lastWrite() == command, "trigger command: " + pdu.transport.lastWrite());
        check(published == 1, "trigger not broadcast");
        check(session.getFlags().groupOperationInFlight, "group operation flag");
        check(session.getQueue().getOutstanding().timeoutMs == 2 * RESPONSE_TIMEOUT_MS, "trigger response window");
        check(!session.triggerGroupByName("Lighting"), "second trigger accepted during a broadcast");

        bench.advance(2 * RESPONSE_TIMEOUT_MS + COMMAND_RETRY_DELAY_MS - 10);
        check(pdu.transport.countWrites(command) == 1, "trigger resent inside its 20 s window");
        bench.advance(10);
        check(pdu.transport.countWrites(command) == 2, "trigger not resent after its window");

        bench.respond(pdu, "power outletgroup 2 cycle");
        check(!session.getFlags().groupOperationInFlight, "group operation not finished");
        check(session.getFlags().postGroupCooldown, "cooldown not started");
        check(!session.getBroadcast().isProcessing(), "broadcast not completed");

        // Next poll lands inside the cooldown
        size_t outletQueries = pdu.transport.countWrites("show outlets\r\n");
        size_t groupQueries = pdu.transport.countWrites("show outletgroups\r\n");
        bench.advance(POLL_INTERVAL_MS - 2 * RESPONSE_TIMEOUT_MS - COMMAND_RETRY_DELAY_MS);
        check(pdu.transport.lastWrite() == "show inlets\r\n", "poll did not run during the cooldown");
        bench.answer(pdu);
        check(pdu.transport.countWrites("show outlets\r\n") == outletQueries, "outlet listing polled during cooldown");
        check(pdu.transport.countWrites("show outletgroups\r\n") == groupQueries + 1, "group listing not polled");

        bench.advance(POLL_INTERVAL_MS);
        check(!session.getFlags().postGroupCooldown, "cooldown did not end");
        bench.answer(pdu);
        check(pdu.transport.countWrites("show outlets\r\n") == outletQueries + 1, "outlet listing not polled after cooldown");
    }
};

ITestCase *get_test_trigger_group_by_name()
{
    static Test_TriggerGroupByName inst;
    return &inst;
}

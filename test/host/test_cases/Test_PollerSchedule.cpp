/**
 * TestCase: Test_PollerSchedule
 *
 * Goal:
 *   Fixed-interval poll batches that stay out of the way of user activity.
 *
 * Expected behavior:
 *   - The first batch goes out after the start delay, then every 30 s.
 *   - While outlet queries are suppressed (group operation or cooldown)
 *     the batch has no "show outlets".
 *   - A busy cycle is skipped; five skips in a row stop the chain.
 *   - restart() polls immediately when idle and refuses when busy.
 */

#include <vector>
#include "TestBench.h"
#include "TestCase.h"
#include "poller.h"

class Test_PollerSchedule : public BasicTestCase
{
public:
    const char *name() const override { return "Poller: batches, outlet suppression, skip halt"; }

protected:
    void run() override
    {
        TestBench bench;
        Poller poller(bench.scheduler);

        bool busy = false;
        bool suppressed = false;
        std::vector<std::vector<PduCommand>> batches;
        poller.setBusyCheck([&]()
                            { return busy; });
        poller.setOutletQuerySuppressed([&]()
                                        { return suppressed; });
        poller.setBatchSink([&](const std::vector<PduCommand> &batch)
                            { batches.push_back(batch); });

        poller.startAfter(FIRST_POLL_DELAY_MS);
        bench.advance(FIRST_POLL_DELAY_MS - 10);
        check(batches.empty(), "polled before the start delay");
        bench.advance(10);
        if (!check(batches.size() == 1, "first batch missing"))
        {
            return;
        }
        check(batches[0].size() == 6, "full batch size");
        check(batches[0][0].text == "show inlets", "batch must start with the inlet query");
        check(batches[0][4].text == "show outlets", "full batch without outlet listing");
        check(batches[0][5].text == "show outletgroups", "batch must end with the group listing");
        check(!batches[0][0].userInitiated, "poll marked as user command");

        // Group operation in flight: the group listing carries outlet truth
        suppressed = true;
        bench.advance(POLL_INTERVAL_MS);
        if (!check(batches.size() == 2, "second batch missing"))
        {
            return;
        }
        check(batches[1].size() == 5, "suppressed batch size");
        for (const auto &command : batches[1])
        {
            check(command.text != "show outlets", "outlet listing sent during a group operation");
        }
        check(batches[1].back().text == "show outletgroups", "suppressed batch lost the group listing");

        // Busy: skipped cycles until the chain halts
        suppressed = false;
        busy = true;
        bench.advance(POLL_INTERVAL_MS * MAX_POLL_SKIPS);
        check(poller.getSkipCount() == MAX_POLL_SKIPS, "skip count after five busy cycles");
        check(poller.isActive(), "chain stopped before the sixth cycle");
        bench.advance(POLL_INTERVAL_MS);
        check(!poller.isActive(), "chain still active after too many skips");
        check(batches.size() == 2, "batch submitted while busy");

        busy = false;
        bench.advance(POLL_INTERVAL_MS * 3);
        check(batches.size() == 2, "halted chain polled again");

        busy = true;
        check(!poller.restart(), "restart polled while busy");
        busy = false;
        check(poller.restart(), "restart did not poll when idle");
        check(batches.size() == 3 && poller.isActive(), "restart did not resume the chain");
        check(poller.getBatchCount() == 3, "batch counter");

        poller.stop();
        bench.advance(POLL_INTERVAL_MS * 2);
        check(batches.size() == 3, "stopped poller still polling");
    }
};

ITestCase *get_test_poller_schedule()
{
    static Test_PollerSchedule inst;
    return &inst;
}

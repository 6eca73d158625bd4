/**
 * TestCase: Test_ReconnectBackoff
 *
 * Goal:
 *   Exponential backoff with jitter and a hard attempt limit.
 */

#include "TestBench.h"
#include "TestCase.h"
#include "reconnect_manager.h"

class Test_ReconnectBackoff : public BasicTestCase
{
public:
    const char *name() const override { return "Reconnect: backoff, jitter and attempt limit"; }

protected:
    void run() override
    {
        TestBench bench;
        ReconnectManager reconnect(bench.scheduler);

        check(reconnect.backoffDelay(0) == 2000, "attempt 0 delay");
        check(reconnect.backoffDelay(1) == 4000, "attempt 1 delay");
        check(reconnect.backoffDelay(4) == 32000, "attempt 4 delay");
        check(reconnect.backoffDelay(5) == 60000, "delay not capped at 60 s");
        check(reconnect.backoffDelay(200) == 60000, "large attempt number not capped");

        uint32_t attempts = 0;
        uint32_t exhausted = 0;
        reconnect.setJitterSource([](uint32_t limitMs)
                                  { return limitMs / 8; });
        reconnect.setAttemptCallback([&]()
                                     { attempts++; });
        reconnect.setExhaustedCallback([&]()
                                       { exhausted++; });

        check(reconnect.schedule(), "first attempt not scheduled");
        check(reconnect.getLastDelay() == 2250, "jitter not added to the delay");
        check(reconnect.schedule() && reconnect.getAttempts() == 1, "pending attempt scheduled twice");

        bench.advance(2249);
        check(attempts == 0, "attempt fired early");
        bench.advance(1);
        check(attempts == 1 && !reconnect.isPending(), "first attempt did not fire");

        for (uint8_t i = 1; i < MAX_RECONNECT_ATTEMPTS; i++)
        {
            check(reconnect.schedule(), "attempt not scheduled");
            check(reconnect.getLastDelay() == reconnect.backoffDelay(i) + 250, "delay for attempt " + std::to_string(i));
            bench.advance(reconnect.getLastDelay());
        }
        check(attempts == MAX_RECONNECT_ATTEMPTS, "not every attempt fired");
        check(reconnect.isExhausted(), "limit not reached");

        check(!reconnect.schedule(), "attempt scheduled past the limit");
        check(exhausted == 1, "exhausted callback not raised");
        bench.advance(RECONNECT_MAX_DELAY_MS * 2);
        check(attempts == MAX_RECONNECT_ATTEMPTS, "attempt fired past the limit");

        reconnect.reset();
        check(reconnect.getAttempts() == 0 && reconnect.schedule(), "reset did not allow new attempts");
        reconnect.cancel();
        bench.advance(RECONNECT_MAX_DELAY_MS);
        check(attempts == MAX_RECONNECT_ATTEMPTS, "cancelled attempt fired");

        // Default jitter stays inside its window
        ReconnectManager defaults(bench.scheduler);
        defaults.schedule();
        check(defaults.getLastDelay() >= RECONNECT_BASE_DELAY_MS &&
                  defaults.getLastDelay() < RECONNECT_BASE_DELAY_MS + RECONNECT_JITTER_MS,
              "default jitter out of range");
    }
};

ITestCase *get_test_reconnect_backoff()
{
    static Test_ReconnectBackoff inst;
    return &inst;
}

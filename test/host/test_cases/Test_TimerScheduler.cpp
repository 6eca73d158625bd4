/**
 * TestCase: Test_TimerScheduler
 *
 * Goal:
 *   Cooperative timers fire in due order, may schedule more timers from a
 *   callback, and never exceed the configured cap.
 *
 * Expected behavior:
 *   - One update() fires every due timer, earliest due first.
 *   - A zero-delay timer scheduled from a callback fires in the same update().
 *   - Scheduling past the cap evicts the oldest timer.
 *   - Due times survive the 32-bit millisecond wrap.
 */

#include <vector>
#include "TestCase.h"
#include "timer_scheduler.h"

class Test_TimerScheduler : public BasicTestCase
{
public:
    const char *name() const override { return "Scheduler: due order, nesting and timer cap"; }

protected:
    void run() override
    {
        TimerScheduler scheduler(4);
        scheduler.update(1000);

        std::vector<int> fired;
        scheduler.schedule(300, [&]()
                           { fired.push_back(3); });
        scheduler.schedule(100, [&]()
                           { fired.push_back(1); });
        scheduler.schedule(200, [&]()
                           {
                               fired.push_back(2);
                               scheduler.schedule(0, [&]()
                                                  { fired.push_back(20); }); });

        scheduler.update(1099);
        check(fired.empty(), "timer fired before its due time");

        scheduler.update(1500);
        check(fired == std::vector<int>({1, 2, 3, 20}), "timers fired out of order");
        check(scheduler.activeCount() == 0, "fired timers still active");

        // Cap of four: the fifth evicts the oldest
        TimerId first = scheduler.schedule(1000, [&]()
                                           { fired.push_back(100); });
        TimerId second = scheduler.schedule(1000, [&]()
                                            { fired.push_back(101); });
        scheduler.schedule(1000, [&]()
                           { fired.push_back(102); });
        scheduler.schedule(1000, [&]()
                           { fired.push_back(103); });
        scheduler.schedule(1000, [&]()
                           { fired.push_back(104); });

        check(scheduler.activeCount() == 4, "timer cap exceeded");
        check(scheduler.evictedCount() == 1, "eviction not counted");
        check(!scheduler.isActive(first), "oldest timer was not evicted");

        check(scheduler.cancel(second), "cancel of active timer failed");
        check(!scheduler.cancel(second), "second cancel reported success");
        check(!scheduler.cancel(NO_TIMER), "cancel of NO_TIMER reported success");

        fired.clear();
        scheduler.update(2500);
        check(fired == std::vector<int>({102, 103, 104}), "wrong timers fired after eviction and cancel");

        // Millisecond counter wrap
        TimerScheduler wrapping;
        wrapping.update(0xFFFFFF00u);
        bool wrapped = false;
        wrapping.schedule(0x200, [&]()
                          { wrapped = true; });
        wrapping.update(0xFFFFFFF0u);
        check(!wrapped, "timer fired early across wrap");
        wrapping.update(0x100);
        check(wrapped, "timer did not fire after wrap");
    }
};

ITestCase *get_test_timer_scheduler()
{
    static Test_TimerScheduler inst;
    return &inst;
}

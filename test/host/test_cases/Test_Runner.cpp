#include "Test_Runner.h"
#include <cstdio>
#include <cstring>

TestRunner::TestRunner()
{
    for (auto &t : _tests)
    {
        t = nullptr;
    }
}

void TestRunner::setFilter(const char *filter)
{
    _filter = (filter && *filter) ? filter : nullptr;
}

void TestRunner::add(ITestCase *tc)
{
    if (tc == nullptr)
    {
        return;
    }
    if (_filter && std::strstr(tc->name(), _filter) == nullptr)
    {
        _filtered++;
        return;
    }
    if (_count >= kMaxTests)
    {
        std::printf("[TEST_RUNNER] too many tests, dropped: %s\n", tc->name());
        return;
    }
    _tests[_count++] = tc;
}

void TestRunner::start(uint32_t nowMs)
{
    if (_started || _count == 0)
    {
        return;
    }
    _started = true;
    _finished = false;
    _index = 0;
    _startMs = nowMs;

    enterCurrent(nowMs);
}

void TestRunner::enterCurrent(uint32_t nowMs)
{
    logStart(_tests[_index]);
    _tests[_index]->enter(nowMs);
}

void TestRunner::tick(uint32_t nowMs)
{
    if (!_started || _finished)
    {
        return;
    }

    ITestCase *tc = _tests[_index];
    if (tc->verdict() == TestVerdict::Running)
    {
        tc->tick(nowMs);
    }

    if (tc->verdict() == TestVerdict::Running)
    {
        return;
    }

    tc->exit(nowMs);
    logEnd(tc);

    switch (tc->verdict())
    {
    case TestVerdict::Pass:
        _pass++;
        break;
    case TestVerdict::Fail:
        _fail++;
        break;
    case TestVerdict::Skip:
        _skip++;
        break;
    default:
        break;
    }

    _index++;
    if (_index >= (int16_t)_count)
    {
        _finished = true;
        _endMs = nowMs;
        dumpSummary();
        return;
    }

    enterCurrent(nowMs);
}

bool TestRunner::finished() const { return _finished; }
uint16_t TestRunner::passedCount() const { return _pass; }
uint16_t TestRunner::failedCount() const { return _fail; }
uint16_t TestRunner::skippedCount() const { return _skip; }

void TestRunner::logStart(ITestCase *tc)
{
    std::printf("[TEST] START: %s\n", tc->name());
}

void TestRunner::logEnd(ITestCase *tc)
{
    if (!tc)
    {
        return;
    }
    std::printf("[TEST_RUNNER] END:   %s -> %s (%s)\n", tc->name(), verdictToString(tc->verdict()), tc->detail());
    if (tc->verdict() == TestVerdict::Fail)
    {
        tc->dump();
    }
}

void TestRunner::dumpSummary()
{
    std::printf("=============================================================\n");
    std::printf("TEST SUMMARY\n");
    std::printf("-------------------------------------------------------------\n");

    for (uint8_t i = 0; i < _count; i++)
    {
        const ITestCase *tc = _tests[i];
        std::printf("%2u. %-50s\t%s\n", (unsigned)(i + 1), tc->name(), verdictToString(tc->verdict()));
    }

    std::printf("-------------------------------------------------------------\n");
    std::printf("PASSED:  %u\n", (unsigned)_pass);
    std::printf("FAILED:  %u\n", (unsigned)_fail);
    std::printf("SKIPPED: %u\n", (unsigned)_skip);
    if (_filter)
    {
        std::printf("FILTER:  \"%s\" (%u not run)\n", _filter, (unsigned)_filtered);
    }

    const float runtimeSec = (_endMs - _startMs) / 1000.0f;
    std::printf("RUNTIME: %.2f s\n", runtimeSec);

    std::printf("=============================================================\n");
}

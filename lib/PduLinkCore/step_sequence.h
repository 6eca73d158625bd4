#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// Step Sequence
// -------------------------------------------------------------------------
// An ordered list of (delay, action) steps driven by one timer at a time.
// Each delay counts from the previous step. An action returning false
// stops the sequence; cancel() drops whatever has not run yet.

class StepSequence
{
public:
    typedef std::function<bool()> StepAction;

    StepSequence(TimerScheduler &scheduler, const std::string &name);
    ~StepSequence();

    StepSequence(const StepSequence &) = delete;
    StepSequence &operator=(const StepSequence &) = delete;

    StepSequence &then(uint32_t delayMs, StepAction action);
    void clear();

    void start();
    void cancel();
    bool isRunning() const { return pendingTimer != NO_TIMER; }
    size_t stepCount() const { return steps.size(); }

private:
    struct Step
    {
        uint32_t delayMs;
        StepAction action;
    };

    TimerScheduler &scheduler;
    std::string name;
    std::vector<Step> steps;
    size_t nextStep = 0;
    TimerId pendingTimer = NO_TIMER;

    void scheduleNext();
    void runStep(size_t index);
};

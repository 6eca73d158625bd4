#include "step_sequence.h"
#include "logger.h"
#include <utility>

StepSequence::StepSequence(TimerScheduler &scheduler, const std::string &name)
    : scheduler(scheduler), name(name)
{
}

StepSequence::~StepSequence()
{
    cancel();
}

StepSequence &StepSequence::then(uint32_t delayMs, StepAction action)
{
    steps.push_back(Step{delayMs, std::move(action)});
    return *this;
}

void StepSequence::clear()
{
    cancel();
    steps.clear();
}

void StepSequence::start()
{
    cancel();
    nextStep = 0;
    LOG_DEBUG("Sequence '" + name + "' started (" + std::to_string(steps.size()) + " steps)");
    scheduleNext();
}

void StepSequence::cancel()
{
    if (pendingTimer != NO_TIMER)
    {
        scheduler.cancel(pendingTimer);
        pendingTimer = NO_TIMER;
        LOG_DEBUG("Sequence '" + name + "' cancelled at step " + std::to_string(nextStep + 1));
    }
}

void StepSequence::scheduleNext()
{
    if (nextStep >= steps.size())
    {
        pendingTimer = NO_TIMER;
        return;
    }

    size_t index = nextStep;
    pendingTimer = scheduler.schedule(steps[index].delayMs, [this, index]()
                                      { runStep(index); },
                                      name.c_str());
}

void StepSequence::runStep(size_t index)
{
    pendingTimer = NO_TIMER;
    nextStep = index + 1;

    if (!steps[index].action())
    {
        LOG_DEBUG("Sequence '" + name + "' stopped after step " + std::to_string(index + 1));
        return;
    }

    scheduleNext();
}

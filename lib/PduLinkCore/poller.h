#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>
#include "command_queue.h"
#include "timer_scheduler.h"

// -------------------------------------------------------------------------
// Poller
// -------------------------------------------------------------------------
// One timer chain of fixed-interval read-only query batches. A cycle that
// finds the session busy is skipped; too many skips in a row stop the
// chain until restart() is called.

class Poller
{
public:
    typedef std::function<bool()> Predicate;
    typedef std::function<void(const std::vector<PduCommand> &batch)> BatchSink;

    explicit Poller(TimerScheduler &scheduler, uint32_t intervalMs = POLL_INTERVAL_MS);
    ~Poller();

    void setTag(const std::string &newTag) { tag = newTag; }
    void setBusyCheck(Predicate check) { isBusy = check; }
    void setOutletQuerySuppressed(Predicate check) { isOutletQuerySuppressed = check; }
    void setBatchSink(BatchSink sink) { batchSink = sink; }

    void startAfter(uint32_t delayMs);
    // Polls immediately when idle, otherwise leaves the chain alone
    bool restart();
    void stop();

    // One poll cycle; returns true if a batch was submitted
    bool pollNow();

    bool isActive() const { return pollTimer != NO_TIMER; }
    uint8_t getSkipCount() const { return skipCount; }
    uint32_t getBatchCount() const { return batchCount; }

    static std::vector<PduCommand> buildBatch(bool includeOutlets);

private:
    TimerScheduler &scheduler;
    uint32_t intervalMs;
    std::string tag = "pdu";

    Predicate isBusy;
    Predicate isOutletQuerySuppressed;
    BatchSink batchSink;

    TimerId pollTimer = NO_TIMER;
    uint8_t skipCount = 0;
    uint32_t batchCount = 0;

    void scheduleNext(uint32_t delayMs);
    std::string prefix() const { return "[" + tag + "] "; }
};

#pragma once

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>

// -------------------------------------------------------------------------
// Broadcast Channel
// -------------------------------------------------------------------------
// Synchronous pub/sub shared by every session in the process. The device
// build bridges it to peers over UDP; fromNetwork marks messages that came
// in that way so they are not sent back out.

struct BroadcastMessage
{
    std::string groupName;
    std::string originId;
    bool cancel = false;
    bool fromNetwork = false;
};

class BroadcastChannel
{
public:
    typedef std::function<void(const BroadcastMessage &message)> Subscriber;
    typedef uint32_t SubscriptionId;

    SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id);

    // Delivers to every subscriber, the publisher's own subscription included
    void publish(const BroadcastMessage &message);

    size_t subscriberCount() const { return subscribers.size(); }
    uint32_t getPublishCount() const { return publishCount; }

private:
    struct Entry
    {
        SubscriptionId id;
        Subscriber subscriber;
    };

    std::vector<Entry> subscribers;
    SubscriptionId nextId = 1;
    uint32_t publishCount = 0;
};

#include "broadcast_channel.h"
#include "logger.h"

BroadcastChannel::SubscriptionId BroadcastChannel::subscribe(Subscriber subscriber)
{
    SubscriptionId id = nextId++;
    subscribers.push_back(Entry{id, subscriber});
    return id;
}

void BroadcastChannel::unsubscribe(SubscriptionId id)
{
    for (auto it = subscribers.begin(); it != subscribers.end(); ++it)
    {
        if (it->id == id)
        {
            subscribers.erase(it);
            return;
        }
    }
}

void BroadcastChannel::publish(const BroadcastMessage &message)
{
    publishCount++;
    LOG_DEBUG(std::string("Broadcast ") + (message.cancel ? "cancel" : "cycle") + " for group '" +
              message.groupName + "' from " + message.originId);

    // Subscribers may publish or unsubscribe while being notified
    std::vector<Entry> snapshot = subscribers;
    for (const auto &entry : snapshot)
    {
        if (entry.subscriber)
        {
            entry.subscriber(message);
        }
    }
}

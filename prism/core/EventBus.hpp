#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace prism::core
{
/// Editor-wide notifications, e.g. "scene:objectRemoved" with the entity id as args[0].
struct Event
{
    std::string name;
    std::vector<std::string> args;
};

class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId Subscribe(const std::string& eventName, Handler handler);
    /// Removes a handler. Unknown ids are ignored.
    void Unsubscribe(SubscriptionId id);

    /// Queues |event|; handlers run on the next DispatchQueued().
    void Publish(Event event);
    void DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] std::size_t HandlerCount(const std::string& eventName) const;

private:
    struct Subscription
    {
        SubscriptionId id = 0;
        Handler handler;
    };

    std::unordered_map<std::string, std::vector<Subscription>> m_handlers;
    std::queue<Event> m_queue;
    SubscriptionId m_nextId = 1;
};
} // namespace prism::core

#include "prism/core/EventBus.hpp"

#include <algorithm>
#include <utility>

namespace prism::core
{
EventBus::SubscriptionId EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    const SubscriptionId id = m_nextId++;
    m_handlers[eventName].push_back(Subscription{id, std::move(handler)});
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id)
{
    for (auto& [name, subscriptions] : m_handlers)
    {
        const auto it = std::remove_if(subscriptions.begin(), subscriptions.end(),
                                       [id](const Subscription& subscription) { return subscription.id == id; });
        if (it != subscriptions.end())
        {
            subscriptions.erase(it, subscriptions.end());
            return;
        }
    }
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

void EventBus::DispatchQueued()
{
    // Handlers may publish; those events are delivered in this same pass.
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.name);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Copy so a handler can unsubscribe while being dispatched.
        const std::vector<Subscription> subscriptions = it->second;
        for (const Subscription& subscription : subscriptions)
        {
            subscription.handler(event);
        }
    }
}

std::size_t EventBus::HandlerCount(const std::string& eventName) const
{
    const auto it = m_handlers.find(eventName);
    return it != m_handlers.end() ? it->second.size() : 0;
}
} // namespace prism::core

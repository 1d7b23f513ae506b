#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "prism/core/EventBus.hpp"

using namespace prism;

TEST(EventBus, PublishIsDeferredUntilDispatch)
{
    core::EventBus bus;
    std::vector<std::string> received;
    bus.Subscribe("scene:objectRemoved", [&received](const core::Event& event) { received.push_back(event.args.at(0)); });

    bus.Publish(core::Event{"scene:objectRemoved", {"4"}});
    bus.Publish(core::Event{"scene:objectRemoved", {"9"}});
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(bus.PendingCount(), 2u);

    bus.DispatchQueued();
    EXPECT_EQ(received, (std::vector<std::string>{"4", "9"}));
    EXPECT_EQ(bus.PendingCount(), 0u);
}

TEST(EventBus, EventsOnlyReachMatchingHandlers)
{
    core::EventBus bus;
    int initialized = 0;
    int removed = 0;
    bus.Subscribe("renderer:initialized", [&initialized](const core::Event&) { ++initialized; });
    bus.Subscribe("scene:objectRemoved", [&removed](const core::Event&) { ++removed; });

    bus.Publish(core::Event{"renderer:initialized", {"forward"}});
    bus.Publish(core::Event{"nobody:listens", {}});
    bus.DispatchQueued();

    EXPECT_EQ(initialized, 1);
    EXPECT_EQ(removed, 0);
}

TEST(EventBus, UnsubscribeStopsDelivery)
{
    core::EventBus bus;
    int first = 0;
    int second = 0;
    const auto id = bus.Subscribe("tick", [&first](const core::Event&) { ++first; });
    bus.Subscribe("tick", [&second](const core::Event&) { ++second; });
    EXPECT_EQ(bus.HandlerCount("tick"), 2u);

    bus.Unsubscribe(id);
    bus.Unsubscribe(id); // unknown ids are ignored
    EXPECT_EQ(bus.HandlerCount("tick"), 1u);

    bus.Publish(core::Event{"tick", {}});
    bus.DispatchQueued();
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItselfAndPublish)
{
    core::EventBus bus;
    int calls = 0;
    int followUps = 0;
    core::EventBus::SubscriptionId self = 0;
    self = bus.Subscribe("once", [&](const core::Event&) {
        ++calls;
        bus.Unsubscribe(self);
        bus.Publish(core::Event{"after", {}});
    });
    bus.Subscribe("after", [&followUps](const core::Event&) { ++followUps; });

    bus.Publish(core::Event{"once", {}});
    bus.Publish(core::Event{"once", {}});
    bus.DispatchQueued();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(followUps, 1);
    EXPECT_EQ(bus.HandlerCount("once"), 0u);
}

#include <catch2/catch_test_macros.hpp>
#include "store/event_bus.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace tether::store;

namespace {

struct Ping {
    int value = 0;
};

struct Note {
    std::string text;
};

constexpr EventKey<Ping> kPing{"test.ping"};
constexpr EventKey<Note> kNote{"test.note"};

} // namespace

TEST_CASE("EventBus: delivers in subscription order", "[bus]") {
    EventBus bus;
    std::vector<std::string> calls;

    auto a = bus.subscribe(kPing, [&](const Ping& p) { calls.push_back("a" + std::to_string(p.value)); });
    auto b = bus.subscribe(kPing, [&](const Ping& p) { calls.push_back("b" + std::to_string(p.value)); });

    bus.publish(kPing, Ping{1});
    bus.publish(kPing, Ping{2});

    REQUIRE(calls == std::vector<std::string>{"a1", "b1", "a2", "b2"});
}

TEST_CASE("EventBus: events are keyed by name", "[bus]") {
    EventBus bus;
    int pings = 0;
    std::string last_note;

    auto p = bus.subscribe(kPing, [&](const Ping&) { ++pings; });
    auto n = bus.subscribe(kNote, [&](const Note& note) { last_note = note.text; });

    bus.publish(kNote, Note{"hello"});
    REQUIRE(pings == 0);
    REQUIRE(last_note == "hello");
    REQUIRE(bus.subscriber_count("test.ping") == 1);
    REQUIRE(bus.subscriber_count("test.none") == 0);
}

TEST_CASE("EventBus: publishing without subscribers is a no-op", "[bus]") {
    EventBus bus;
    bus.publish(kPing, Ping{1});
    REQUIRE(bus.subscriber_count("test.ping") == 0);
}

TEST_CASE("EventBus: dropping the subscription unsubscribes", "[bus]") {
    EventBus bus;
    int calls = 0;
    {
        auto sub = bus.subscribe(kPing, [&](const Ping&) { ++calls; });
        REQUIRE(sub.active());
        bus.publish(kPing, Ping{});
    }
    bus.publish(kPing, Ping{});
    REQUIRE(calls == 1);
    REQUIRE(bus.subscriber_count("test.ping") == 0);
}

TEST_CASE("EventBus: moved subscriptions stay registered once", "[bus]") {
    EventBus bus;
    int calls = 0;
    Subscription outer;
    {
        auto sub = bus.subscribe(kPing, [&](const Ping&) { ++calls; });
        outer = std::move(sub);
        REQUIRE_FALSE(sub.active());
    }
    bus.publish(kPing, Ping{});
    REQUIRE(calls == 1);
    REQUIRE(outer.active());

    outer.reset();
    bus.publish(kPing, Ping{});
    REQUIRE(calls == 1);
}

TEST_CASE("EventBus: a handler removed during delivery is not called", "[bus]") {
    EventBus bus;
    int second_calls = 0;
    Subscription second;

    auto first = bus.subscribe(kPing, [&](const Ping&) { second.reset(); });
    second = bus.subscribe(kPing, [&](const Ping&) { ++second_calls; });

    bus.publish(kPing, Ping{});
    REQUIRE(second_calls == 0);
    REQUIRE(bus.subscriber_count("test.ping") == 1);
}

TEST_CASE("EventBus: a handler can unsubscribe itself", "[bus]") {
    EventBus bus;
    int calls = 0;
    Subscription self;
    self = bus.subscribe(kPing, [&](const Ping&) {
        ++calls;
        self.reset();
    });

    bus.publish(kPing, Ping{});
    bus.publish(kPing, Ping{});
    REQUIRE(calls == 1);
}

TEST_CASE("EventBus: a handler added during delivery sees the next publish", "[bus]") {
    EventBus bus;
    int late_calls = 0;
    std::vector<Subscription> added;

    auto first = bus.subscribe(kPing, [&](const Ping&) {
        if (added.empty()) {
            added.push_back(bus.subscribe(kPing, [&](const Ping&) { ++late_calls; }));
        }
    });

    bus.publish(kPing, Ping{});
    REQUIRE(late_calls == 0);
    bus.publish(kPing, Ping{});
    REQUIRE(late_calls == 1);
}

TEST_CASE("EventBus: handlers may publish other events", "[bus]") {
    EventBus bus;
    std::vector<std::string> order;

    auto relay = bus.subscribe(kPing, [&](const Ping& p) {
        order.push_back("ping");
        bus.publish(kNote, Note{std::to_string(p.value)});
    });
    auto sink = bus.subscribe(kNote, [&](const Note& n) { order.push_back("note " + n.text); });

    bus.publish(kPing, Ping{7});
    REQUIRE(order == std::vector<std::string>{"ping", "note 7"});
}

TEST_CASE("EventBus: subscriptions may outlive the bus", "[bus]") {
    Subscription sub;
    {
        auto bus = std::make_unique<EventBus>();
        sub = bus->subscribe(kPing, [](const Ping&) {});
        REQUIRE(sub.active());
    }
    REQUIRE_FALSE(sub.active());
    sub.reset();
}

#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <vector>

using namespace chordrelay;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) {
        count++;
    });

    TurnStartedEvent ev;
    ev.session_id = "s1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(TurnCommittedEvent::TAG, [&](const Event&) { order.push_back(1); });
    bus.subscribe(TurnCommittedEvent::TAG, [&](const Event&) { order.push_back(2); });

    TurnCommittedEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: other tags are not delivered", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(TurnRolledBackEvent::TAG, [&](const Event&) { count++; });

    TurnCancelledEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: typed subscribe sees concrete fields", "[event_bus]") {
    EventBus bus;
    std::string reason;
    subscribe<TurnRolledBackEvent>(bus, [&](const TurnRolledBackEvent& ev) {
        reason = ev.reason;
    });

    TurnRolledBackEvent ev;
    ev.session_id = "s1";
    ev.reason = "HTTP 500";
    bus.publish(ev);
    REQUIRE(reason == "HTTP 500");
}

TEST_CASE("EventBus: wildcard subscribers run after tag subscribers", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> seen;
    bus.subscribe(EventBus::kAnyTag, [&](const Event& e) {
        seen.push_back(std::string("any:") + e.type_tag);
    });
    bus.subscribe(TurnCancelledEvent::TAG, [&](const Event&) { seen.push_back("tag"); });

    TurnCancelledEvent cancelled;
    bus.publish(cancelled);
    TurnStartedEvent started;
    bus.publish(started);

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0] == "tag");
    REQUIRE(seen[1] == "any:TurnCancelled");
    REQUIRE(seen[2] == "any:TurnStarted");
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;
    bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) {
        bus.subscribe(TurnStartedEvent::TAG, [&](const Event&) { late++; });
    });

    TurnStartedEvent ev;
    bus.publish(ev);
    REQUIRE(late == 0);
    bus.publish(ev);
    REQUIRE(late == 1);
}

TEST_CASE("publish_if: null bus is a no-op", "[event_bus]") {
    TurnStartedEvent ev;
    publish_if(nullptr, ev);
    SUCCEED();
}

#include <catch2/catch.hpp>
#include "conversation_store.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace chordrelay;

static Message sys(const std::string& c) { return Message{Role::System, c}; }
static Message usr(const std::string& c) { return Message{Role::User, c}; }
static Message bot(const std::string& c) { return Message{Role::Assistant, c}; }

// ── Basic operations ────────────────────────────────────────────

TEST_CASE("ConversationStore: unknown session reads empty", "[store]") {
    ConversationStore store;
    REQUIRE(store.read("nobody").empty());
    REQUIRE(store.read_for_backend("nobody").empty());
    REQUIRE(store.size("nobody") == 0);
    REQUIRE(store.session_ids().empty());
}

TEST_CASE("ConversationStore: append creates and preserves order", "[store]") {
    ConversationStore store;
    store.append("s1", usr("hi"));
    store.append("s1", bot("hello"));

    auto msgs = store.read("s1");
    REQUIRE(msgs.size() == 2);
    REQUIRE(msgs[0] == usr("hi"));
    REQUIRE(msgs[1] == bot("hello"));
    REQUIRE(store.session_ids() == std::vector<std::string>{"s1"});
}

TEST_CASE("ConversationStore: read returns a copy", "[store]") {
    ConversationStore store;
    store.append("s1", usr("hi"));
    auto msgs = store.read("s1");
    msgs.push_back(bot("local only"));
    REQUIRE(store.size("s1") == 1);
}

TEST_CASE("ConversationStore: sessions are independent", "[store]") {
    ConversationStore store;
    store.append("a", usr("one"));
    store.append("b", usr("two"));
    store.append("b", bot("three"));
    REQUIRE(store.size("a") == 1);
    REQUIRE(store.size("b") == 2);
    REQUIRE(store.session_ids() == std::vector<std::string>{"a", "b"});
}

// ── System prefix ───────────────────────────────────────────────

TEST_CASE("ConversationStore: read_for_backend puts system messages first", "[store]") {
    ConversationStore store;
    store.set_exact("s1", {usr("u1"), sys("s-a"), bot("a1"), sys("s-b"), usr("u2")});

    auto out = store.read_for_backend("s1");
    REQUIRE(out == std::vector<Message>{sys("s-a"), sys("s-b"), usr("u1"), bot("a1"), usr("u2")});

    // Insertion order is untouched
    REQUIRE(store.read("s1")[0] == usr("u1"));
}

TEST_CASE("ConversationStore: replace_system_prefix swaps only system messages", "[store]") {
    ConversationStore store;
    store.set_exact("s1", {sys("old"), usr("u1"), bot("a1"), sys("old2")});

    store.replace_system_prefix("s1", {sys("new1"), sys("new2")});
    REQUIRE(store.read("s1") ==
            std::vector<Message>{sys("new1"), sys("new2"), usr("u1"), bot("a1")});
}

TEST_CASE("ConversationStore: replace_system_prefix on unknown session", "[store]") {
    ConversationStore store;
    store.replace_system_prefix("fresh", {sys("rules")});
    REQUIRE(store.read("fresh") == std::vector<Message>{sys("rules")});
}

TEST_CASE("order_system_first: stable for each group", "[store]") {
    auto out = order_system_first({bot("b"), sys("1"), usr("u"), sys("2")});
    REQUIRE(out == std::vector<Message>{sys("1"), sys("2"), bot("b"), usr("u")});
}

// ── Rollback support ────────────────────────────────────────────

TEST_CASE("ConversationStore: remove_last drops exactly one", "[store]") {
    ConversationStore store;
    store.append("s1", usr("a"));
    store.append("s1", usr("b"));
    store.remove_last("s1");
    REQUIRE(store.read("s1") == std::vector<Message>{usr("a")});
}

TEST_CASE("ConversationStore: remove_last on empty or unknown is a no-op", "[store]") {
    ConversationStore store;
    store.remove_last("ghost");
    REQUIRE(store.size("ghost") == 0);

    store.set_exact("s1", {});
    store.remove_last("s1");
    REQUIRE(store.read("s1").empty());
}

TEST_CASE("ConversationStore: set_exact overwrites", "[store]") {
    ConversationStore store;
    store.append("s1", usr("old"));
    store.set_exact("s1", {sys("x"), usr("y")});
    REQUIRE(store.read("s1") == std::vector<Message>{sys("x"), usr("y")});
}

// ── Turn guard ──────────────────────────────────────────────────

TEST_CASE("ConversationStore: second turn on a busy session is refused", "[store]") {
    ConversationStore store;
    auto first = store.try_begin_turn("s1");
    REQUIRE(first);

    auto second = store.try_begin_turn("s1");
    REQUIRE_FALSE(second);

    // Other sessions are unaffected
    auto other = store.try_begin_turn("s2");
    REQUIRE(other);
}

TEST_CASE("ConversationStore: guard releases on destruction and release()", "[store]") {
    ConversationStore store;
    {
        auto guard = store.try_begin_turn("s1");
        REQUIRE(guard);
    }
    auto again = store.try_begin_turn("s1");
    REQUIRE(again);
    again.release();
    REQUIRE_FALSE(again);
    REQUIRE(store.try_begin_turn("s1"));
}

TEST_CASE("ConversationStore: moved guard keeps the claim", "[store]") {
    ConversationStore store;
    auto a = store.try_begin_turn("s1");
    ConversationStore::TurnGuard b = std::move(a);
    REQUIRE_FALSE(a);
    REQUIRE(b);
    REQUIRE_FALSE(store.try_begin_turn("s1"));
}

// ── Concurrency ─────────────────────────────────────────────────

TEST_CASE("ConversationStore: concurrent appends to different sessions", "[store]") {
    ConversationStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            std::string sid = "s" + std::to_string(t);
            for (int i = 0; i < kPerThread; ++i) {
                store.append(sid, usr(std::to_string(i)));
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(store.session_ids().size() == kThreads);
    for (int t = 0; t < kThreads; ++t) {
        auto msgs = store.read("s" + std::to_string(t));
        REQUIRE(msgs.size() == kPerThread);
        REQUIRE(msgs.back().content == std::to_string(kPerThread - 1));
    }
}

TEST_CASE("ConversationStore: only one concurrent claimant wins", "[store]") {
    ConversationStore store;
    std::atomic<int> winners{0};
    std::vector<ConversationStore::TurnGuard> guards(8);

    std::vector<std::thread> threads;
    for (size_t t = 0; t < guards.size(); ++t) {
        threads.emplace_back([&, t]() {
            guards[t] = store.try_begin_turn("shared");
            if (guards[t]) winners++;
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(winners.load() == 1);
}

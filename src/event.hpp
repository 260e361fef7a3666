#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace chordrelay {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TurnStarted    = "TurnStarted";
    constexpr const char* TurnCommitted  = "TurnCommitted";
    constexpr const char* TurnRolledBack = "TurnRolledBack";
    constexpr const char* TurnCancelled  = "TurnCancelled";
    constexpr const char* AgentCreated   = "AgentCreated";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct TurnStartedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnStarted;
    std::string session_id;
    std::string provider;
    std::string model;
    size_t message_count = 0;

    TurnStartedEvent() { type_tag = TAG; }
};

struct TurnCommittedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnCommitted;
    std::string session_id;
    size_t content_length = 0;
    std::optional<uint64_t> tokens;
    size_t dropped_lines = 0;

    TurnCommittedEvent() { type_tag = TAG; }
};

struct TurnRolledBackEvent : Event {
    static constexpr const char* TAG = event_tags::TurnRolledBack;
    std::string session_id;
    std::string reason;

    TurnRolledBackEvent() { type_tag = TAG; }
};

struct TurnCancelledEvent : Event {
    static constexpr const char* TAG = event_tags::TurnCancelled;
    std::string session_id;

    TurnCancelledEvent() { type_tag = TAG; }
};

struct AgentCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::AgentCreated;
    std::string agent_id;

    AgentCreatedEvent() { type_tag = TAG; }
};

} // namespace chordrelay

#pragma once
#include "backend.hpp"
#include "conversation_store.hpp"
#include "event_emitter.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace chordrelay {

class EventBus;

// Provider id clients may send in place of the backend's own name.
constexpr const char* kLocalBackendAlias = "local-backend";

// POST /api/chat body.
struct ChatTurnRequest {
    std::string provider;
    std::string model;
    std::string session_id;
    std::vector<Message> system_messages;
    std::vector<Message> history;
    std::string message;

    // Reads the client JSON shape. Throws BadRequest for a non-object body or
    // a supplied message with an unknown role. Blank supplied messages are
    // discarded, the rest trimmed.
    static ChatTurnRequest from_json(const nlohmann::json& body);
};

// POST /api/chat/once body.
struct OnceRequest {
    std::string provider;
    std::string model;
    std::vector<Message> messages;

    static OnceRequest from_json(const nlohmann::json& body);
};

enum class TurnResult { Committed, RolledBack, Cancelled };

const char* turn_result_name(TurnResult result);

// A validated turn holding its session's turn guard.
struct PreparedTurn {
    ChatTurnRequest request;
    ConversationStore::TurnGuard guard;
};

// Drives one chat turn end to end: validate, optimistic write, stream the
// backend reply to the client, then commit or roll back.
class RelayController {
public:
    RelayController(ConversationStore& store, Backend& backend, EventBus* bus = nullptr);

    // Throws BadRequest on invalid input and SessionBusy when the session
    // already has a turn in flight. Touches nothing in the store.
    PreparedTurn prepare(ChatTurnRequest request);

    // Streams a prepared turn to out. Never throws for backend failures:
    // those roll back the user turn and end with one error event.
    // Cancellation ends silently, leaving the user turn in place.
    TurnResult stream(PreparedTurn turn, PushStream& out);

    // prepare() then stream(); throws what prepare() throws.
    TurnResult run_turn(ChatTurnRequest request, PushStream& out);

    // Non-streaming completion over the supplied messages. Does not touch
    // the store. Throws BadRequest or the backend's error types.
    ChatReply complete_once(const OnceRequest& request);

    bool accepts_provider(const std::string& provider) const;

private:
    void persist_user_turn(const ChatTurnRequest& request);
    TurnResult roll_back(const std::string& session_id, const std::string& reason,
                         EventEmitter& emitter);
    TurnResult cancel(const std::string& session_id);

    ConversationStore& store_;
    Backend& backend_;
    EventBus* bus_;
};

} // namespace chordrelay

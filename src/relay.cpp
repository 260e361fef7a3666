#include "relay.hpp"
#include "backends/ndjson.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace chordrelay {

static std::string string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Keeps entries with non-blank string content, trimmed. Rejects unknown roles.
static std::vector<Message> normalize_messages(const json& body, const char* key) {
    std::vector<Message> out;
    auto it = body.find(key);
    if (it == body.end() || !it->is_array()) return out;

    for (const auto& entry : *it) {
        if (!entry.is_object()) continue;
        std::string content = trim(string_field(entry, "content"));
        if (content.empty()) continue;

        std::string role_name = string_field(entry, "role");
        auto role = role_from_string(role_name);
        if (!role) {
            throw BadRequest("Invalid message role: " + role_name);
        }
        out.push_back(Message{*role, std::move(content)});
    }
    return out;
}

ChatTurnRequest ChatTurnRequest::from_json(const json& body) {
    if (!body.is_object()) throw BadRequest("Invalid JSON payload");

    ChatTurnRequest req;
    req.provider = string_field(body, "provider");
    req.model = trim(string_field(body, "model"));
    req.session_id = trim(string_field(body, "sessionId"));
    req.message = trim(string_field(body, "message"));
    req.system_messages = normalize_messages(body, "systemMessages");
    req.history = normalize_messages(body, "history");
    return req;
}

OnceRequest OnceRequest::from_json(const json& body) {
    if (!body.is_object()) throw BadRequest("Invalid JSON payload");

    OnceRequest req;
    req.provider = string_field(body, "provider");
    req.model = trim(string_field(body, "model"));
    req.messages = normalize_messages(body, "messages");
    return req;
}

static void log_dropped(const std::string& session_id, size_t dropped) {
    if (dropped == 0) return;
    std::cerr << "[relay] Dropped " << dropped
              << " malformed backend line(s) for session " << session_id << "\n";
}

const char* turn_result_name(TurnResult result) {
    switch (result) {
        case TurnResult::Committed: return "committed";
        case TurnResult::RolledBack: return "rolled back";
        case TurnResult::Cancelled: return "cancelled";
    }
    return "unknown";
}

RelayController::RelayController(ConversationStore& store, Backend& backend, EventBus* bus)
    : store_(store), backend_(backend), bus_(bus) {}

bool RelayController::accepts_provider(const std::string& provider) const {
    return provider == backend_.backend_name() || provider == kLocalBackendAlias;
}

PreparedTurn RelayController::prepare(ChatTurnRequest request) {
    if (!accepts_provider(request.provider)) {
        throw BadRequest("Unsupported provider: " + request.provider);
    }
    if (request.model.empty()) throw BadRequest("Missing model");
    if (request.session_id.empty()) throw BadRequest("Missing sessionId");
    if (request.message.empty()) throw BadRequest("Missing message content");

    auto guard = store_.try_begin_turn(request.session_id);
    if (!guard) throw SessionBusy(request.session_id);

    return PreparedTurn{std::move(request), std::move(guard)};
}

void RelayController::persist_user_turn(const ChatTurnRequest& request) {
    const std::string& sid = request.session_id;

    if (!request.history.empty()) {
        std::vector<Message> combined;
        if (!request.system_messages.empty()) {
            combined = request.system_messages;
        } else {
            for (const auto& m : store_.read(sid)) {
                if (m.role == Role::System) combined.push_back(m);
            }
        }
        combined.insert(combined.end(), request.history.begin(), request.history.end());
        store_.set_exact(sid, order_system_first(combined));
    } else if (!request.system_messages.empty()) {
        store_.replace_system_prefix(sid, request.system_messages);
    }

    store_.append(sid, Message{Role::User, request.message});
}

TurnResult RelayController::roll_back(const std::string& session_id,
                                      const std::string& reason,
                                      EventEmitter& emitter) {
    store_.remove_last(session_id);

    TurnRolledBackEvent ev;
    ev.session_id = session_id;
    ev.reason = reason;
    publish_if(bus_, ev);

    emitter.emit(ClientEvent::error(reason));
    return TurnResult::RolledBack;
}

TurnResult RelayController::cancel(const std::string& session_id) {
    TurnCancelledEvent ev;
    ev.session_id = session_id;
    publish_if(bus_, ev);
    return TurnResult::Cancelled;
}

TurnResult RelayController::run_turn(ChatTurnRequest request, PushStream& out) {
    return stream(prepare(std::move(request)), out);
}

TurnResult RelayController::stream(PreparedTurn turn, PushStream& out) {
    const ChatTurnRequest& req = turn.request;
    const std::string& sid = req.session_id;
    EventEmitter emitter(out);

    // Optimistic write: the user turn is stored before the backend sees it
    persist_user_turn(req);
    auto conversation = store_.read_for_backend(sid);

    {
        TurnStartedEvent ev;
        ev.session_id = sid;
        ev.provider = backend_.backend_name();
        ev.model = req.model;
        ev.message_count = conversation.size();
        publish_if(bus_, ev);
    }

    NdjsonFramer framer;
    std::string content;
    std::optional<uint64_t> tokens;
    bool saw_done = false;
    bool cancelled = false;

    auto on_record = [&](const BackendRecord& record) {
        if (!record.delta.empty()) {
            if (emitter.cancelled()) {
                cancelled = true;
                return false;
            }
            content += record.delta;
            if (!emitter.emit(ClientEvent::delta(record.delta))) {
                cancelled = true;
                return false;
            }
        }
        if (record.done) {
            saw_done = true;
            if (record.eval_count) tokens = record.eval_count;
        }
        return true;
    };

    try {
        StreamOutcome outcome = backend_.complete_streaming(conversation, req.model,
            [&](const char* data, size_t len) {
                if (emitter.cancelled()) {
                    cancelled = true;
                    return false;
                }
                return framer.feed(data, len, on_record);
            },
            [&emitter] { return emitter.cancelled(); });

        if (cancelled || emitter.cancelled()) return cancel(sid);

        // The framer stops the transfer on an error record; raise it only
        // once the HTTP client has returned.
        if (framer.has_error()) throw StreamError(framer.error());
        if (outcome.cancelled) return cancel(sid);

        if (!outcome.transport_error.empty() && !saw_done) {
            throw StreamError("Backend stream ended unexpectedly: " + outcome.transport_error);
        }
        framer.finish(on_record);
        if (framer.has_error()) throw StreamError(framer.error());
    } catch (const std::exception& e) {
        log_dropped(sid, framer.dropped_count());
        // A client that already left is never rolled back
        if (emitter.cancelled()) return cancel(sid);
        return roll_back(sid, e.what(), emitter);
    }

    log_dropped(sid, framer.dropped_count());
    if (cancelled || emitter.cancelled()) return cancel(sid);

    store_.append(sid, Message{Role::Assistant, content});

    TurnCommittedEvent ev;
    ev.session_id = sid;
    ev.content_length = content.size();
    ev.tokens = tokens;
    ev.dropped_lines = framer.dropped_count();
    publish_if(bus_, ev);

    emitter.emit(ClientEvent::done(std::move(content), tokens));
    return TurnResult::Committed;
}

ChatReply RelayController::complete_once(const OnceRequest& request) {
    if (!accepts_provider(request.provider)) {
        throw BadRequest("Unsupported provider: " + request.provider);
    }
    if (request.model.empty()) throw BadRequest("Missing model");
    if (request.messages.empty()) throw BadRequest("Missing messages");

    return backend_.complete_once(order_system_first(request.messages), request.model);
}

} // namespace chordrelay

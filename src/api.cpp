#include "api.hpp"
#include "agent_store.hpp"
#include "catalog.hpp"
#include "conversation_store.hpp"
#include "errors.hpp"
#include "relay.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using json = nlohmann::json;

namespace chordrelay {

static std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static ServerResponse json_reply(int status, const json& body) {
    return ServerResponse::json(status, dump(body));
}

static ServerResponse json_error(int status, const std::string& message) {
    return json_reply(status, json{{"error", message}});
}

static json parse_body(const ServerRequest& req) {
    json body = json::parse(req.body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object()) {
        throw BadRequest("Invalid JSON payload");
    }
    return body;
}

// Status for a backend failure outside an event stream.
static int upstream_status(const UpstreamRejected& e) {
    return e.status_code() >= 400 && e.status_code() < 600
        ? static_cast<int>(e.status_code()) : 502;
}

static json agents_to_json(const std::vector<AgentProfile>& agents) {
    json list = json::array();
    for (const auto& a : agents) {
        list.push_back({{"id", a.id}, {"label", a.label}, {"prompt", a.prompt}});
    }
    return list;
}

Api::Api(RelayController& relay, ConversationStore& store,
         std::vector<Backend*> backends, AgentStore& agents)
    : relay_(relay), store_(store), backends_(std::move(backends)), agents_(agents) {}

void Api::register_routes(HttpServer& server) {
    server.route("POST", "/api/chat",           [this](const ServerRequest& r) { return chat(r); });
    server.route("POST", "/api/chat/once",      [this](const ServerRequest& r) { return chat_once(r); });
    server.route("GET",  "/api/chat/providers", [this](const ServerRequest& r) { return providers(r); });
    server.route("GET",  "/api/agents",         [this](const ServerRequest& r) { return list_agents(r); });
    server.route("POST", "/api/agents",         [this](const ServerRequest& r) { return create_agent(r); });
    server.route("GET",  "/api/agents/{id}",    [this](const ServerRequest& r) { return get_agent(r); });
    server.route("GET",  "/api/health",         [this](const ServerRequest& r) { return health(r); });
}

ServerResponse Api::chat(const ServerRequest& req) {
    std::shared_ptr<PreparedTurn> turn;
    try {
        turn = std::make_shared<PreparedTurn>(
            relay_.prepare(ChatTurnRequest::from_json(parse_body(req))));
    } catch (const BadRequest& e) {
        return json_error(400, e.what());
    } catch (const SessionBusy& e) {
        return json_error(409, e.what());
    }

    RelayController& relay = relay_;
    return ServerResponse::event_stream([&relay, turn](PushStream& out) {
        relay.stream(std::move(*turn), out);
    });
}

ServerResponse Api::chat_once(const ServerRequest& req) {
    try {
        ChatReply reply = relay_.complete_once(OnceRequest::from_json(parse_body(req)));
        json body = {
            {"message", {{"role", "assistant"}, {"content", reply.content}}}
        };
        if (reply.completion_tokens) body["tokens"] = *reply.completion_tokens;
        return json_reply(200, body);
    } catch (const BadRequest& e) {
        return json_error(400, e.what());
    } catch (const UpstreamRejected& e) {
        return json_error(upstream_status(e), e.what());
    } catch (const UpstreamUnavailable& e) {
        return json_error(502, e.what());
    } catch (const StreamError& e) {
        return json_error(502, e.what());
    }
}

ServerResponse Api::providers(const ServerRequest&) {
    return json_reply(200, providers_to_json(list_providers(backends_)));
}

ServerResponse Api::list_agents(const ServerRequest&) {
    return json_reply(200, json{{"agents", agents_to_json(agents_.list_agents())}});
}

ServerResponse Api::create_agent(const ServerRequest& req) {
    try {
        json body = parse_body(req);
        std::string label = body.contains("label") && body["label"].is_string()
            ? body["label"].get<std::string>() : "";
        std::string prompt = body.contains("prompt") && body["prompt"].is_string()
            ? body["prompt"].get<std::string>() : "";

        std::string created = agents_.create_agent(label, prompt);
        return json_reply(200, json{
            {"agents", agents_to_json(agents_.list_agents())},
            {"createdId", created}
        });
    } catch (const BadRequest& e) {
        return json_error(400, e.what());
    }
}

ServerResponse Api::get_agent(const ServerRequest& req) {
    std::string id = req.path_param("id");
    try {
        std::string prompt = agents_.get_agent_prompt(id);
        return json_reply(200, json{{"id", id}, {"prompt", prompt}});
    } catch (const BadRequest& e) {
        return json_error(400, e.what());
    } catch (const NotFound& e) {
        return json_error(404, e.what());
    }
}

ServerResponse Api::health(const ServerRequest&) {
    return json_reply(200, json{
        {"status", "ok"},
        {"sessions", store_.session_ids().size()},
        {"time", timestamp_now()}
    });
}

} // namespace chordrelay

#pragma once
#include "server/http_server.hpp"
#include <vector>

namespace chordrelay {

class RelayController;
class ConversationStore;
class AgentStore;
class Backend;

// JSON route handlers for the browser-facing API.
class Api {
public:
    Api(RelayController& relay, ConversationStore& store,
        std::vector<Backend*> backends, AgentStore& agents);

    void register_routes(HttpServer& server);

    ServerResponse chat(const ServerRequest& req);
    ServerResponse chat_once(const ServerRequest& req);
    ServerResponse providers(const ServerRequest& req);
    ServerResponse list_agents(const ServerRequest& req);
    ServerResponse create_agent(const ServerRequest& req);
    ServerResponse get_agent(const ServerRequest& req);
    ServerResponse health(const ServerRequest& req);

private:
    RelayController& relay_;
    ConversationStore& store_;
    std::vector<Backend*> backends_;
    AgentStore& agents_;
};

} // namespace chordrelay

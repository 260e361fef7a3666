#include "config.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "conversation_store.hpp"
#include "agent_store.hpp"
#include "relay.hpp"
#include "api.hpp"
#include "server/http_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chordrelay [options]\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address to serve the API on (default: 127.0.0.1:3001)\n"
              << "  --ollama-url URL     Base URL of the Ollama server\n"
              << "  --agents-dir DIR     Directory holding agent profiles (*.md)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  POST /api/chat             Streaming chat turn (text/event-stream)\n"
              << "  POST /api/chat/once        Single non-streaming completion\n"
              << "  GET  /api/chat/providers   Backends and their models\n"
              << "  GET  /api/agents           Agent profiles\n"
              << "  POST /api/agents           Create an agent profile\n"
              << "  GET  /api/agents/{id}      One agent profile prompt\n"
              << "  GET  /api/health           Liveness check\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_BASE_URL         Base URL for Ollama (default: http://127.0.0.1:11434)\n"
              << "  CHORDRELAY_LISTEN       Listen address\n"
              << "  CHORDRELAY_AGENTS_DIR   Agent profile directory\n";
}

// Turn lifecycle -> stderr
static void subscribe_turn_logger(chordrelay::EventBus& bus) {
    chordrelay::subscribe<chordrelay::TurnStartedEvent>(bus,
        [](const chordrelay::TurnStartedEvent& ev) {
            std::cerr << "[relay] Session " << ev.session_id << " turn started ("
                      << ev.provider << "/" << ev.model << ", "
                      << ev.message_count << " messages)\n";
        });
    chordrelay::subscribe<chordrelay::TurnCommittedEvent>(bus,
        [](const chordrelay::TurnCommittedEvent& ev) {
            std::cerr << "[relay] Session " << ev.session_id << " committed "
                      << ev.content_length << " bytes, tokens: ";
            if (ev.tokens) std::cerr << *ev.tokens;
            else std::cerr << "n/a";
            std::cerr << "\n";
        });
    chordrelay::subscribe<chordrelay::TurnRolledBackEvent>(bus,
        [](const chordrelay::TurnRolledBackEvent& ev) {
            std::cerr << "[relay] Session " << ev.session_id
                      << " rolled back: " << ev.reason << "\n";
        });
    chordrelay::subscribe<chordrelay::TurnCancelledEvent>(bus,
        [](const chordrelay::TurnCancelledEvent& ev) {
            std::cerr << "[relay] Session " << ev.session_id << " cancelled by client\n";
        });
    chordrelay::subscribe<chordrelay::AgentCreatedEvent>(bus,
        [](const chordrelay::AgentCreatedEvent& ev) {
            std::cerr << "[agents] Created profile " << ev.agent_id << "\n";
        });
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string ollama_url;
    std::string agents_dir;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--ollama-url") == 0 && i + 1 < argc) {
            ollama_url = argv[++i];
        } else if (std::strcmp(argv[i], "--agents-dir") == 0 && i + 1 < argc) {
            agents_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    chordrelay::http_init();
    auto config = chordrelay::Config::load();

    // Override config with CLI args
    if (!listen.empty()) config.listen = listen;
    if (!ollama_url.empty()) config.backends["ollama"].base_url = ollama_url;
    if (!agents_dir.empty()) config.agents_dir = agents_dir;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    chordrelay::http_set_abort_flag(&g_shutdown);

    chordrelay::PlatformHttpClient http_client;
    auto& registry = chordrelay::PluginRegistry::instance();

    std::vector<std::unique_ptr<chordrelay::Backend>> owned;
    std::vector<chordrelay::Backend*> backends;
    for (const auto& name : registry.backend_names()) {
        owned.push_back(registry.create_backend(name, http_client, config));
        backends.push_back(owned.back().get());
    }

    chordrelay::Backend* relay_backend = nullptr;
    for (auto* backend : backends) {
        if (backend->backend_name() == "ollama") relay_backend = backend;
    }
    if (!relay_backend) {
        std::cerr << "Error creating backend: ollama is not registered\n";
        chordrelay::http_cleanup();
        return 1;
    }

    chordrelay::EventBus bus;
    subscribe_turn_logger(bus);

    chordrelay::ConversationStore store;
    chordrelay::AgentStore agents(config.agents_path(), &bus);
    chordrelay::RelayController relay(store, *relay_backend, &bus);
    chordrelay::Api api(relay, store, backends, agents);

    chordrelay::HttpServer server(config.listen, config.max_body);
    api.register_routes(server);

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        chordrelay::http_cleanup();
        return 1;
    }
    std::cerr << "[server] Listening on " << config.listen
              << " (ollama: " << relay_backend->label() << " at "
              << config.base_url_for("ollama") << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    chordrelay::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

#pragma once
#include "../event_emitter.hpp"
#include <string>
#include <functional>
#include <map>
#include <vector>
#include <list>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <cstdint>

namespace chordrelay {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/api/chat"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;       // header names lowercased
    std::map<std::string, std::string> path_params;   // filled from "{name}" route segments
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
    std::string path_param(const std::string& key) const;
};

// Handler output. When `stream` is set the connection answers with a
// text/event-stream and the callback writes frames until it returns;
// status, content_type and body are ignored.
struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
    std::function<void(PushStream&)> stream;

    static ServerResponse json(int status, std::string body);
    static ServerResponse event_stream(std::function<void(PushStream&)> writer);
};

// Minimal HTTP/1.1 server on POSIX sockets. Each accepted connection is
// served on its own thread, so a long-lived event stream never blocks other
// requests. Every response closes its connection.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:3001"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register a route. A trailing "{name}" segment in the pattern matches
    // one path segment and is exposed via path_param(name).
    void route(const std::string& method, const std::string& pattern, Handler handler);

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, shut down open client sockets, join every worker.
    void stop();

    // Port actually bound.
    uint16_t port() const { return bound_port_; }

    // Route a request without a socket. Unknown path -> 404, wrong method -> 405.
    ServerResponse dispatch(ServerRequest& req) const;

private:
    struct Route {
        std::string method;
        std::vector<std::string> segments;
        Handler handler;
    };

    struct Worker {
        int fd = -1;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished = std::make_shared<std::atomic<bool>>(false);
    };

    void accept_loop();
    void handle_connection(int client_fd) const;
    void reap_workers(bool all);

    std::string listen_addr_;
    uint32_t    max_body_;
    std::vector<Route> routes_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse "a=1&b=two" with percent and '+' decoding.
std::map<std::string, std::string> parse_query_string(const std::string& qs);

} // namespace chordrelay

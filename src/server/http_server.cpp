#include "server/http_server.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace chordrelay {

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ServerRequest::path_param(const std::string& key) const {
    auto it = path_params.find(key);
    return it != path_params.end() ? it->second : "";
}

ServerResponse ServerResponse::json(int status, std::string body) {
    ServerResponse resp;
    resp.status = status;
    resp.body = std::move(body);
    return resp;
}

ServerResponse ServerResponse::event_stream(std::function<void(PushStream&)> writer) {
    ServerResponse resp;
    resp.content_type = "text/event-stream";
    resp.stream = std::move(writer);
    return resp;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string port_text = addr.substr(pos + 1);
        int p = std::stoi(port_text, &used);
        if (used != port_text.size() || p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Socket I/O ────────────────────────────────────────────────────────────────

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return status >= 200 && status < 300 ? "OK" : "Error";
    }
}

static void send_http_response(int fd, int status, const std::string& content_type,
                               const std::string& body) {
    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n"
        "Content-Type: " + content_type + "\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + body;

    send_all(fd, resp);
}

static std::string error_body(const std::string& message) {
    nlohmann::json j = {{"error", message}};
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Event stream over a client socket. Disconnect is seen either as a failed
// send or as a hang-up on the socket between frames.
class SocketPushStream : public PushStream {
public:
    SocketPushStream(int fd, const std::atomic<bool>& running)
        : fd_(fd), running_(running) {}

    bool write(const std::string& frame) override {
        if (closed_) return false;
        if (!send_all(fd_, frame)) closed_ = true;
        return !closed_;
    }

    bool cancelled() const override {
        if (closed_ || !running_.load()) return true;

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
#ifdef POLLRDHUP
        pfd.events |= POLLRDHUP;
#endif
        if (::poll(&pfd, 1, 0) <= 0) return false;

        short hangup = POLLHUP | POLLERR;
#ifdef POLLRDHUP
        hangup |= POLLRDHUP;
#endif
        if (pfd.revents & hangup) {
            closed_ = true;
        } else if (pfd.revents & POLLIN) {
            // Request is fully read, so readable means EOF or reset
            char peeked;
            ssize_t n = ::recv(fd_, &peeked, 1, MSG_PEEK | MSG_DONTWAIT);
            if (n <= 0) closed_ = true;
        }
        return closed_;
    }

private:
    int fd_;
    const std::atomic<bool>& running_;
    mutable bool closed_ = false;
};

// ── HttpServer ───────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& pattern,
                       Handler handler) {
    Route r;
    r.method = method;
    for (const auto& seg : split(pattern, '/')) {
        if (!seg.empty()) r.segments.push_back(seg);
    }
    r.handler = std::move(handler);
    routes_.push_back(std::move(r));
}

ServerResponse HttpServer::dispatch(ServerRequest& req) const {
    std::vector<std::string> parts;
    for (const auto& seg : split(req.path, '/')) {
        if (!seg.empty()) parts.push_back(url_decode(seg));
    }

    bool path_matched = false;
    for (const auto& r : routes_) {
        if (r.segments.size() != parts.size()) continue;

        std::map<std::string, std::string> params;
        bool match = true;
        for (size_t i = 0; i < parts.size() && match; ++i) {
            const auto& seg = r.segments[i];
            if (seg.size() > 2 && seg.front() == '{' && seg.back() == '}') {
                params[seg.substr(1, seg.size() - 2)] = parts[i];
            } else if (seg != parts[i]) {
                match = false;
            }
        }
        if (!match) continue;

        path_matched = true;
        if (r.method != req.method) continue;

        req.path_params = std::move(params);
        try {
            return r.handler(req);
        } catch (const std::exception& e) {
            std::cerr << "[server] " << req.method << " " << req.path
                      << " failed: " << e.what() << "\n";
            return ServerResponse::json(500, error_body(e.what()));
        }
    }

    if (path_matched) return ServerResponse::json(405, error_body("Method not allowed"));
    return ServerResponse::json(404, error_body("Not found"));
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [this, &error](const std::string& message) {
        error = message;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail("listen failed");
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t ignored = ::write(shutdown_pipe_[1], &b, 1);
        (void)ignored;
    }
    if (thread_.joinable()) thread_.join();

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& w : workers_) {
            if (!w.finished->load()) ::shutdown(w.fd, SHUT_RDWR);
        }
    }
    reap_workers(true);

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::reap_workers(bool all) {
    std::list<Worker> done;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->finished->load()) {
                auto next = std::next(it);
                done.splice(done.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : done) {
        if (w.thread.joinable()) w.thread.join();
        ::close(w.fd);
    }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        reap_workers(false);

        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout while reading the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.emplace_back();
        Worker& w = workers_.back();
        w.fd = cfd;
        auto finished = w.finished;
        w.thread = std::thread([this, cfd, finished]() {
            handle_connection(cfd);
            ::shutdown(cfd, SHUT_RDWR);
            finished->store(true);
        });
    }
}

// ── Request handling ─────────────────────────────────────────────────────────

void HttpServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_http_response(fd, 400, "application/json", error_body("Headers too large"));
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    ServerRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_http_response(fd, 400, "application/json", error_body("Malformed request line"));
            return;
        }
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body for POST.
    if (req.method == "POST") {
        size_t content_len = 0;
        auto it = req.headers.find("content-length");
        if (it != req.headers.end()) {
            try {
                content_len = std::stoul(it->second);
            } catch (const std::exception&) {
                send_http_response(fd, 400, "application/json", error_body("Invalid Content-Length"));
                return;
            }
        }

        if (content_len > max_body_) {
            send_http_response(fd, 413, "application/json", error_body("Payload too large"));
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) return;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(content_len);
    }

    ServerResponse resp = dispatch(req);
    if (!resp.stream) {
        send_http_response(fd, resp.status, resp.content_type, resp.body);
        return;
    }

    std::string head =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache, no-transform\r\n"
        "X-Accel-Buffering: no\r\n"
        "Connection: close\r\n\r\n";
    if (!send_all(fd, head)) return;

    SocketPushStream stream(fd, running_);
    try {
        resp.stream(stream);
    } catch (const std::exception& e) {
        std::cerr << "[server] Event stream for " << req.path << " failed: " << e.what() << "\n";
    }
}

} // namespace chordrelay

// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace chordrelay {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    long     idle_limit_secs = 0;  // 0 = wait forever
    const CancelCheck* is_cancelled = nullptr;
    bool     cancelled = false;
    std::string error;             // last failure, for HttpResponse::error

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "cannot connect to " + url.host + ":" + url.port + ": " +
                    std::strerror(last_errno);
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                error = "TLS handshake with " + url.host + " failed";
                return false;
            }
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error.
    // EAGAIN (1-second slice expiry) loops back so the caller can check abort,
    // until idle_limit_secs consecutive slices pass without data.
    ssize_t read_some(char* buf, size_t len) {
        long idle_slices = 0;
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed)) {
                error = "aborted";
                return -1;
            }
            if (is_cancelled && *is_cancelled && (*is_cancelled)()) {
                cancelled = true;
                error = "cancelled";
                return -1;
            }

            ssize_t n;
            bool slice_expired = false;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    slice_expired = true;
                } else {
                    error = "TLS read failed";
                    return -1;
                }
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    slice_expired = true;
                } else {
                    error = std::string("read failed: ") + std::strerror(errno);
                    return -1;
                }
            }

            if (slice_expired && idle_limit_secs > 0 && ++idle_slices >= idle_limit_secs) {
                error = "read timed out after " + std::to_string(idle_limit_secs) +
                        "s without data";
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed";
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    error = std::string("write failed: ") + std::strerror(errno);
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!body.empty() && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF or read failure before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    bool& is_chunked, bool& has_length,
                                    size_t& content_length) {
    is_chunked     = false;
    has_length     = false;
    content_length = 0;

    std::string status_line;
    if (!read_line(conn, leftover, status_line) || status_line.empty()) {
        if (conn.error.empty()) conn.error = "connection closed before response";
        return 0;
    }

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) {
        conn.error = "malformed status line";
        return 0;
    }
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 999) {
        conn.error = "malformed status line";
        return 0;
    }

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line)) {
            if (conn.error.empty()) conn.error = "connection closed in headers";
            return 0;
        }
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            is_chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            char* end = nullptr;
            unsigned long long v = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str()) {
                content_length = static_cast<size_t>(v);
                has_length = true;
            }
        }
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

enum class BodyResult { Complete, Aborted, Failed };

// Stream body to a RawChunkCallback; dechunks if needed. A body that ends
// before its framing says it should (missing terminal chunk, short
// content-length) is reported as Failed with conn.error set.
static BodyResult stream_body_raw(Connection& conn, std::string& leftover,
                                   bool is_chunked, bool has_length,
                                   size_t content_length,
                                   const RawChunkCallback& callback) {
    if (is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line)) {
                if (conn.error.empty()) conn.error = "connection closed mid-stream";
                return BodyResult::Failed;
            }
            if (size_line.empty()) continue;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return BodyResult::Complete;

            size_t remaining = chunk_size;
            while (remaining > 0) {
                if (!leftover.empty()) {
                    size_t take = std::min(remaining, leftover.size());
                    if (!callback(leftover.data(), take)) return BodyResult::Aborted;
                    leftover.erase(0, take);
                    remaining -= take;
                    continue;
                }
                char buf[4096];
                ssize_t n = conn.read_some(buf, std::min(remaining, sizeof(buf)));
                if (n <= 0) {
                    if (conn.error.empty()) conn.error = "connection closed mid-chunk";
                    return BodyResult::Failed;
                }
                if (!callback(buf, static_cast<size_t>(n))) return BodyResult::Aborted;
                remaining -= static_cast<size_t>(n);
            }
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) {
                if (conn.error.empty()) conn.error = "connection closed mid-stream";
                return BodyResult::Failed;
            }
        }
    }

    size_t remaining = content_length;
    while (!has_length || remaining > 0) {
        if (!leftover.empty()) {
            size_t take = has_length
                ? std::min(remaining, leftover.size())
                : leftover.size();
            if (!callback(leftover.data(), take)) return BodyResult::Aborted;
            leftover.erase(0, take);
            if (has_length) remaining -= take;
            continue;
        }
        size_t want = has_length
            ? std::min(remaining, static_cast<size_t>(4096))
            : 4096;
        char buf[4096];
        ssize_t n = conn.read_some(buf, want);
        if (n < 0) return BodyResult::Failed;
        if (n == 0) {
            if (!has_length) return BodyResult::Complete; // read-to-close body
            conn.error = "connection closed before full body";
            return BodyResult::Failed;
        }
        if (!callback(buf, static_cast<size_t>(n))) return BodyResult::Aborted;
        if (has_length) remaining -= static_cast<size_t>(n);
    }
    return BodyResult::Complete;
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const StatusCallback& on_status,
                                const RawChunkCallback& callback,
                                long connect_timeout_secs,
                                long idle_timeout_secs,
                                const CancelCheck* is_cancelled = nullptr) {
    HttpResponse resp;

    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn;
    if (!conn.connect(url, connect_timeout_secs)) {
        resp.error = conn.error;
        return resp;
    }
    conn.idle_limit_secs = idle_timeout_secs;
    conn.is_cancelled = is_cancelled;

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.error;
        return resp;
    }

    std::string leftover;
    bool   is_chunked     = false;
    bool   has_length     = false;
    size_t content_length = 0;
    long status = parse_response_headers(conn, leftover, is_chunked,
                                         has_length, content_length);
    if (status == 0) {
        if (conn.cancelled) resp.aborted = true;
        else resp.error = conn.error;
        return resp;
    }
    resp.status_code = status;

    if (on_status && !on_status(status)) {
        resp.aborted = true;
        return resp;
    }

    switch (stream_body_raw(conn, leftover, is_chunked, has_length,
                            content_length, callback)) {
        case BodyResult::Complete: break;
        case BodyResult::Aborted:  resp.aborted = true; break;
        case BodyResult::Failed:
            if (conn.cancelled) resp.aborted = true;
            else resp.error = conn.error;
            break;
    }
    return resp;
}

static HttpResponse do_buffered(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_secs) {
    std::string collected;
    RawChunkCallback collect = [&collected](const char* data, size_t len) {
        collected.append(data, len);
        return true;
    };
    HttpResponse resp = do_request(method, url, body, headers, nullptr, collect,
                                   timeout_secs, timeout_secs);
    resp.body = std::move(collected);
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_buffered("POST", url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_buffered("GET", url, "", headers, timeout_seconds);
}

// Default base-class implementations delegate to the free functions.
HttpResponse HttpClient::get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse HttpClient::stream_post_raw(const std::string& url,
                                          const std::string& body,
                                          const std::vector<Header>& headers,
                                          StatusCallback on_status,
                                          RawChunkCallback callback,
                                          long idle_timeout_seconds,
                                          CancelCheck is_cancelled) {
    return http_stream_post_raw(url, body, headers, std::move(on_status),
                                std::move(callback), idle_timeout_seconds,
                                std::move(is_cancelled));
}

HttpResponse http_stream_post_raw(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   StatusCallback on_status,
                                   RawChunkCallback callback,
                                   long idle_timeout_seconds,
                                   CancelCheck is_cancelled) {
    return do_request("POST", url, body, headers, on_status, callback,
                      idle_timeout_seconds, idle_timeout_seconds, &is_cancelled);
}

} // namespace chordrelay

#endif // __linux__

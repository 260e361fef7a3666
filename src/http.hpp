#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace chordrelay {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;     // 0 = no response (connect/send failed)
    std::string body;
    std::string error;        // transport failure description, empty on success
    bool aborted = false;     // a callback returned false
};

// Called once with the response status, before any body bytes.
// Return false to abort the stream.
using StatusCallback = std::function<bool(long status_code)>;

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Polled about once a second while a stream waits for data.
// Returning true aborts the transfer.
using CancelCheck = std::function<bool()>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30);

    // Streams the response body. idle_timeout_seconds bounds both the connect
    // and every gap between received bytes; there is no overall deadline.
    // A set is_cancelled ends a quiet stream without waiting for more bytes;
    // the response is then marked aborted.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         StatusCallback on_status,
                                         RawChunkCallback callback,
                                         long idle_timeout_seconds = 300,
                                         CancelCheck is_cancelled = nullptr);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Elsewhere: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

// HTTP POST with raw-chunk streaming (caller parses the body)
HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  StatusCallback on_status,
                                  RawChunkCallback callback,
                                  long idle_timeout_seconds = 300,
                                  CancelCheck is_cancelled = nullptr);

} // namespace chordrelay

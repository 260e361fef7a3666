#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace chordrelay {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct RawStreamContext {
    CURL* curl = nullptr;
    StatusCallback* on_status = nullptr;
    RawChunkCallback* callback = nullptr;
    CancelCheck* is_cancelled = nullptr;
    bool status_reported = false;
    bool aborted = false;
};

// Progress hook for streams: the global abort flag plus the caller's check.
static int stream_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    auto* ctx = static_cast<RawStreamContext*>(clientp);
    if (*ctx->is_cancelled && (*ctx->is_cancelled)()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

// Reports the status exactly once; false means the caller asked to stop.
static bool report_status(RawStreamContext& ctx) {
    if (ctx.status_reported) return true;
    ctx.status_reported = true;
    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
    if (*ctx.on_status && !(*ctx.on_status)(code)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;
    if (!report_status(*ctx)) return 0;

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    apply_abort_hook(req.curl);
}

static void set_post_body(CURL* curl, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
}

static HttpResponse perform_buffered(CurlRequest& req) {
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res != CURLE_OK) response.error = curl_easy_strerror(res);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

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

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed", false};
    setup_request(req, url, headers);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    set_post_body(req.curl, body);
    return perform_buffered(req);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed", false};
    setup_request(req, url, headers);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    return perform_buffered(req);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   StatusCallback on_status,
                                   RawChunkCallback callback,
                                   long idle_timeout_seconds,
                                   CancelCheck is_cancelled) {
    CurlRequest req;
    if (!req) return {0, "", "curl_easy_init failed", false};
    setup_request(req, url, headers);
    set_post_body(req.curl, body);

    // No overall deadline: a stream may legitimately run for minutes.
    // Abort only when the connection goes quiet for idle_timeout_seconds.
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, idle_timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, idle_timeout_seconds);

    RawStreamContext ctx;
    ctx.curl = req.curl;
    ctx.on_status = &on_status;
    ctx.callback = &callback;
    ctx.is_cancelled = &is_cancelled;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, stream_progress_cb);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &ctx);

    HttpResponse response;
    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.aborted = ctx.aborted;

    if (res == CURLE_OK) {
        // Empty body: the status was never seen by the write callback.
        if (!ctx.status_reported) {
            report_status(ctx);
            response.aborted = ctx.aborted;
        }
    } else if (!ctx.aborted) {
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace chordrelay

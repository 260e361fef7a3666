#include "ollama.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

static chordrelay::BackendRegistrar reg_ollama("ollama",
    [](chordrelay::HttpClient& http, const chordrelay::BackendEntry& entry,
       const chordrelay::RelayConfig& relay) {
        std::string url = entry.base_url.empty()
            ? chordrelay::kOllamaDefaultBaseUrl : entry.base_url;
        return std::make_unique<chordrelay::OllamaBackend>(
            http, url, relay.stream_idle_timeout, relay.request_timeout);
    });

using json = nlohmann::json;

namespace chordrelay {

static std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// Prefer the backend's {"error": "..."} text, then the raw body.
static std::string rejection_detail(long status, const std::string& body) {
    std::string detail = trim(body);
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("error") && j["error"].is_string()) {
            detail = j["error"].get<std::string>();
        }
    } catch (const json::exception&) { // NOLINT(bugprone-empty-catch)
        // Not JSON; keep the raw text
    }
    if (detail.empty()) {
        detail = "Ollama chat request failed (HTTP " + std::to_string(status) + ")";
    }
    return detail;
}

OllamaBackend::OllamaBackend(HttpClient& http, const std::string& base_url,
                             long stream_idle_timeout, long request_timeout)
    : http_(http), base_url_(strip_trailing_slash(base_url)),
      stream_idle_timeout_(stream_idle_timeout), request_timeout_(request_timeout) {}

std::string OllamaBackend::build_body(const std::vector<Message>& conversation,
                                      const std::string& model, bool stream) const {
    json request;
    request["model"] = model;
    request["stream"] = stream;

    json msgs = json::array();
    for (const auto& msg : conversation) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request.dump();
}

StreamOutcome OllamaBackend::complete_streaming(const std::vector<Message>& conversation,
                                                const std::string& model,
                                                const ChunkCallback& on_chunk,
                                                const StreamCancelCheck& is_cancelled) {
    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/x-ndjson"}
    };

    long status = 0;
    bool rejected = false;
    std::string error_body;

    auto response = http_.stream_post_raw(
        url, build_body(conversation, model, true), headers,
        [&](long code) {
            status = code;
            rejected = code < 200 || code >= 300;
            return true;
        },
        [&](const char* data, size_t len) {
            // A rejected request's body is error text, not stream records.
            if (rejected) {
                error_body.append(data, len);
                return true;
            }
            return on_chunk(data, len);
        },
        stream_idle_timeout_,
        is_cancelled);

    if (response.status_code == 0 && status == 0 && !response.aborted) {
        throw UpstreamUnavailable("Failed to contact Ollama at " + base_url_ +
            (response.error.empty() ? "" : ": " + response.error));
    }
    if (rejected) {
        throw UpstreamRejected(status, error_body, rejection_detail(status, error_body));
    }

    StreamOutcome outcome;
    outcome.status_code = status;
    outcome.cancelled = response.aborted;
    outcome.transport_error = response.error;
    return outcome;
}

ChatReply OllamaBackend::complete_once(const std::vector<Message>& conversation,
                                       const std::string& model) {
    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, build_body(conversation, model, false),
                               headers, request_timeout_);

    if (response.status_code == 0) {
        throw UpstreamUnavailable("Failed to contact Ollama at " + base_url_ +
            (response.error.empty() ? "" : ": " + response.error));
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw UpstreamRejected(response.status_code, response.body,
                               rejection_detail(response.status_code, response.body));
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::exception& e) {
        throw StreamError(std::string("Malformed reply from Ollama: ") + e.what());
    }
    if (!resp.is_object()) {
        throw StreamError("Malformed reply from Ollama: expected an object");
    }
    if (resp.contains("error") && resp["error"].is_string()) {
        throw StreamError(resp["error"].get<std::string>());
    }

    ChatReply reply;
    reply.model = resp.value("model", model);
    if (resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") && resp["message"]["content"].is_string()) {
        reply.content = resp["message"]["content"].get<std::string>();
    }
    if (resp.contains("prompt_eval_count") && resp["prompt_eval_count"].is_number_unsigned()) {
        reply.prompt_tokens = resp["prompt_eval_count"].get<uint64_t>();
    }
    if (resp.contains("eval_count") && resp["eval_count"].is_number_unsigned()) {
        reply.completion_tokens = resp["eval_count"].get<uint64_t>();
    }
    return reply;
}

std::vector<ModelInfo> OllamaBackend::list_models() {
    auto response = http_.get(base_url_ + "/api/tags", {}, request_timeout_);

    if (response.status_code == 0) {
        throw UpstreamUnavailable("Failed to reach Ollama at " + base_url_ +
            (response.error.empty() ? "" : ": " + response.error));
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw UpstreamRejected(response.status_code, response.body,
                               rejection_detail(response.status_code, response.body));
    }

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::exception& e) {
        throw StreamError(std::string("Malformed model list from Ollama: ") + e.what());
    }

    std::vector<ModelInfo> models;
    if (!resp.is_object() || !resp.contains("models") || !resp["models"].is_array()) {
        return models;
    }
    for (const auto& m : resp["models"]) {
        if (!m.is_object()) continue;
        ModelInfo info;
        info.id = m.value("model", m.value("name", ""));
        info.label = m.value("name", info.id);
        if (!info.id.empty()) models.push_back(std::move(info));
    }
    return models;
}

} // namespace chordrelay

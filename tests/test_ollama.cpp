#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "backends/ollama.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace chordrelay;

// ── Helper: find header value ───────────────────────────────────

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

static std::vector<Message> sample_conversation() {
    return {{Role::System, "You are a harmony tutor."}, {Role::User, "hi"}};
}

// ── Streaming ───────────────────────────────────────────────────

TEST_CASE("OllamaBackend: streaming sends correct request", "[ollama]") {
    MockHttpClient mock;
    mock.stream_chunks = {"{\"done\":true}\n"};
    OllamaBackend backend(mock, "http://gpu-box:11434/", 42);

    auto outcome = backend.complete_streaming(sample_conversation(), "llama3",
        [](const char*, size_t) { return true; });

    REQUIRE(outcome.status_code == 200);
    REQUIRE_FALSE(outcome.cancelled);
    REQUIRE(mock.last_url == "http://gpu-box:11434/api/chat");
    REQUIRE(mock.last_timeout == 42);
    REQUIRE(find_header(mock.last_headers, "Content-Type") == "application/json");

    auto body = json::parse(mock.last_body);
    REQUIRE(body["model"] == "llama3");
    REQUIRE(body["stream"] == true);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][1]["role"] == "user");
    REQUIRE(body["messages"][1]["content"] == "hi");
}

TEST_CASE("OllamaBackend: streaming forwards raw chunks in order", "[ollama]") {
    MockHttpClient mock;
    mock.stream_chunks = {"{\"message\":{\"content\":\"he\"}}\n", "{\"mess", "age\":{}}\n"};
    OllamaBackend backend(mock);

    std::string received;
    backend.complete_streaming(sample_conversation(), "m",
        [&](const char* data, size_t len) { received.append(data, len); return true; });

    REQUIRE(received == "{\"message\":{\"content\":\"he\"}}\n{\"message\":{}}\n");
}

TEST_CASE("OllamaBackend: callback false cancels the stream", "[ollama]") {
    MockHttpClient mock;
    mock.stream_chunks = {"a", "b", "c"};
    OllamaBackend backend(mock);

    auto outcome = backend.complete_streaming(sample_conversation(), "m",
        [](const char*, size_t) { return false; });

    REQUIRE(outcome.cancelled);
    REQUIRE(mock.chunks_delivered == 1);
}

TEST_CASE("OllamaBackend: connection failure throws UpstreamUnavailable", "[ollama]") {
    MockHttpClient mock;
    mock.stream_status = 0;
    OllamaBackend backend(mock);

    REQUIRE_THROWS_AS(backend.complete_streaming(sample_conversation(), "m",
        [](const char*, size_t) { return true; }), UpstreamUnavailable);
}

TEST_CASE("OllamaBackend: non-2xx throws UpstreamRejected without forwarding body", "[ollama]") {
    MockHttpClient mock;
    mock.stream_status = 404;
    mock.stream_chunks = {"{\"error\":\"model 'nope' not found\"}"};
    OllamaBackend backend(mock);

    bool forwarded = false;
    try {
        backend.complete_streaming(sample_conversation(), "nope",
            [&](const char*, size_t) { forwarded = true; return true; });
        FAIL("expected UpstreamRejected");
    } catch (const UpstreamRejected& e) {
        REQUIRE(e.status_code() == 404);
        REQUIRE(std::string(e.what()) == "model 'nope' not found");
        REQUIRE(e.body() == "{\"error\":\"model 'nope' not found\"}");
    }
    REQUIRE_FALSE(forwarded);
}

TEST_CASE("OllamaBackend: rejection with plain or empty body", "[ollama]") {
    MockHttpClient mock;
    mock.stream_status = 500;
    OllamaBackend backend(mock);

    SECTION("plain text body is the detail") {
        mock.stream_chunks = {"internal failure\n"};
        try {
            backend.complete_streaming(sample_conversation(), "m",
                [](const char*, size_t) { return true; });
            FAIL("expected UpstreamRejected");
        } catch (const UpstreamRejected& e) {
            REQUIRE(std::string(e.what()) == "internal failure");
        }
    }

    SECTION("empty body falls back to status text") {
        try {
            backend.complete_streaming(sample_conversation(), "m",
                [](const char*, size_t) { return true; });
            FAIL("expected UpstreamRejected");
        } catch (const UpstreamRejected& e) {
            REQUIRE(std::string(e.what()) == "Ollama chat request failed (HTTP 500)");
        }
    }
}

TEST_CASE("OllamaBackend: transport error reported on outcome", "[ollama]") {
    MockHttpClient mock;
    mock.stream_chunks = {"{\"message\":{\"content\":\"x\"}}\n"};
    mock.stream_transport_error = "Connection reset by peer";
    OllamaBackend backend(mock);

    auto outcome = backend.complete_streaming(sample_conversation(), "m",
        [](const char*, size_t) { return true; });
    REQUIRE(outcome.transport_error == "Connection reset by peer");
}

// ── Non-streaming ───────────────────────────────────────────────

TEST_CASE("OllamaBackend: complete_once parses reply", "[ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({
        "model": "llama3",
        "message": {"role": "assistant", "content": "Try a ii-V-I."},
        "done": true,
        "prompt_eval_count": 26,
        "eval_count": 9
    })"};
    OllamaBackend backend(mock, "http://localhost:11434", 300, 60);

    auto reply = backend.complete_once(sample_conversation(), "llama3");
    REQUIRE(reply.content == "Try a ii-V-I.");
    REQUIRE(reply.model == "llama3");
    REQUIRE(reply.prompt_tokens == 26u);
    REQUIRE(reply.completion_tokens == 9u);

    REQUIRE(mock.last_timeout == 60);
    auto body = json::parse(mock.last_body);
    REQUIRE(body["stream"] == false);
}

TEST_CASE("OllamaBackend: complete_once error taxonomy", "[ollama]") {
    MockHttpClient mock;
    OllamaBackend backend(mock);

    SECTION("no response") {
        mock.next_response = {0, "", "Connection refused"};
        REQUIRE_THROWS_AS(backend.complete_once(sample_conversation(), "m"), UpstreamUnavailable);
    }
    SECTION("HTTP error") {
        mock.next_response = {400, R"({"error":"bad"})"};
        REQUIRE_THROWS_AS(backend.complete_once(sample_conversation(), "m"), UpstreamRejected);
    }
    SECTION("malformed JSON") {
        mock.next_response = {200, "not json"};
        REQUIRE_THROWS_AS(backend.complete_once(sample_conversation(), "m"), StreamError);
    }
    SECTION("error field in a 200 reply") {
        mock.next_response = {200, R"({"error":"model is loading"})"};
        REQUIRE_THROWS_AS(backend.complete_once(sample_conversation(), "m"), StreamError);
    }
}

// ── Model listing ───────────────────────────────────────────────

TEST_CASE("OllamaBackend: list_models maps tags", "[ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"models":[
        {"name":"llama3:latest","model":"llama3:latest","modified_at":"2024-05-01"},
        {"name":"Mistral","model":"mistral:7b"}
    ]})"};
    OllamaBackend backend(mock, "http://box:11434");

    auto models = backend.list_models();
    REQUIRE(mock.last_url == "http://box:11434/api/tags");
    REQUIRE(models.size() == 2);
    REQUIRE(models[0].id == "llama3:latest");
    REQUIRE(models[1].id == "mistral:7b");
    REQUIRE(models[1].label == "Mistral");
}

TEST_CASE("OllamaBackend: list_models with no models array", "[ollama]") {
    MockHttpClient mock;
    mock.next_response = {200, "{}"};
    OllamaBackend backend(mock);
    REQUIRE(backend.list_models().empty());
}

TEST_CASE("OllamaBackend: list_models failures throw", "[ollama]") {
    MockHttpClient mock;
    OllamaBackend backend(mock);

    mock.next_response = {0, "", "timeout"};
    REQUIRE_THROWS_AS(backend.list_models(), UpstreamUnavailable);

    mock.next_response = {503, "busy"};
    REQUIRE_THROWS_AS(backend.list_models(), UpstreamRejected);
}

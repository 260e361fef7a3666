#pragma once
#include "../backend.hpp"
#include "../http.hpp"
#include <string>

namespace chordrelay {

constexpr const char* kOllamaDefaultBaseUrl = "http://127.0.0.1:11434";

// Ollama /api/chat and /api/tags over HttpClient.
class OllamaBackend : public Backend {
public:
    OllamaBackend(HttpClient& http,
                  const std::string& base_url = kOllamaDefaultBaseUrl,
                  long stream_idle_timeout = 300,
                  long request_timeout = 120);

    StreamOutcome complete_streaming(const std::vector<Message>& conversation,
                                     const std::string& model,
                                     const ChunkCallback& on_chunk,
                                     const StreamCancelCheck& is_cancelled = nullptr) override;

    ChatReply complete_once(const std::vector<Message>& conversation,
                            const std::string& model) override;

    std::vector<ModelInfo> list_models() override;

    std::string backend_name() const override { return "ollama"; }
    std::string label() const override { return "Ollama (local)"; }

    const std::string& base_url() const { return base_url_; }

private:
    std::string build_body(const std::vector<Message>& conversation,
                           const std::string& model, bool stream) const;

    HttpClient& http_;
    std::string base_url_;
    long stream_idle_timeout_;
    long request_timeout_;
};

} // namespace chordrelay

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <cstdint>

namespace chordrelay {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// Parses "system" / "user" / "assistant"; nullopt for anything else.
std::optional<Role> role_from_string(const std::string& name);

struct Message {
    Role role;
    std::string content;

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

// One-shot completion result.
struct ChatReply {
    std::string content;
    std::string model;
    std::optional<uint64_t> prompt_tokens;
    std::optional<uint64_t> completion_tokens;
};

// How a streaming completion ended when no exception was thrown.
struct StreamOutcome {
    long status_code = 0;
    bool cancelled = false;     // on_chunk returned false or is_cancelled fired
    std::string transport_error; // non-empty when the body was cut short
};

struct ModelInfo {
    std::string id;
    std::string label;
};

// Raw body bytes from a streaming completion. Return false to cancel.
using ChunkCallback = std::function<bool(const char* data, size_t len)>;

// Polled while the backend is quiet; true abandons the stream.
using StreamCancelCheck = std::function<bool()>;

// A model-serving backend. Implementations are pure forwarding: no retries.
class Backend {
public:
    virtual ~Backend() = default;

    // Opens a streaming completion and feeds the body to on_chunk as it
    // arrives. The connection lives for the duration of the call.
    // Throws UpstreamUnavailable or UpstreamRejected before any bytes are
    // delivered; a transfer that breaks later is reported on the outcome.
    virtual StreamOutcome complete_streaming(const std::vector<Message>& conversation,
                                             const std::string& model,
                                             const ChunkCallback& on_chunk,
                                             const StreamCancelCheck& is_cancelled = nullptr) = 0;

    // Non-streaming completion. Same error taxonomy.
    virtual ChatReply complete_once(const std::vector<Message>& conversation,
                                    const std::string& model) = 0;

    // Models the backend can serve. Throws UpstreamUnavailable/UpstreamRejected.
    virtual std::vector<ModelInfo> list_models() = 0;

    virtual std::string backend_name() const = 0;
    virtual std::string label() const = 0;
};

} // namespace chordrelay

#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace chordrelay {

// One client-facing push-stream event.
struct ClientEvent {
    enum class Kind { Delta, Done, Error };

    Kind kind = Kind::Delta;
    std::string text;               // delta fragment, full content, or error message
    std::optional<uint64_t> tokens; // Done only; null when the backend never reported it

    static ClientEvent delta(std::string fragment);
    static ClientEvent done(std::string content, std::optional<uint64_t> tokens);
    static ClientEvent error(std::string message);

    // Compact JSON: {"delta":..} | {"done":true,"content":..,"tokens":..} | {"error":..}
    std::string to_json() const;
};

// "data: <json>\n\n"
std::string encode_sse_frame(const ClientEvent& event);

// Server-initiated, long-lived output channel to one client.
class PushStream {
public:
    virtual ~PushStream() = default;

    // Write one complete frame. Returns false if the client is gone.
    virtual bool write(const std::string& frame) = 0;

    // True once the client has disconnected.
    virtual bool cancelled() const = 0;
};

// Serializes ClientEvents onto a PushStream in emission order.
// After a failed write every later emit is a no-op.
class EventEmitter {
public:
    explicit EventEmitter(PushStream& stream) : stream_(stream) {}

    bool emit(const ClientEvent& event);

    bool cancelled() const { return failed_ || stream_.cancelled(); }

private:
    PushStream& stream_;
    bool failed_ = false;
};

} // namespace chordrelay

#include "event_emitter.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chordrelay {

ClientEvent ClientEvent::delta(std::string fragment) {
    ClientEvent ev;
    ev.kind = Kind::Delta;
    ev.text = std::move(fragment);
    return ev;
}

ClientEvent ClientEvent::done(std::string content, std::optional<uint64_t> tokens) {
    ClientEvent ev;
    ev.kind = Kind::Done;
    ev.text = std::move(content);
    ev.tokens = tokens;
    return ev;
}

ClientEvent ClientEvent::error(std::string message) {
    ClientEvent ev;
    ev.kind = Kind::Error;
    ev.text = std::move(message);
    return ev;
}

std::string ClientEvent::to_json() const {
    json j = json::object();
    switch (kind) {
        case Kind::Delta:
            j["delta"] = text;
            break;
        case Kind::Done:
            j["done"] = true;
            j["content"] = text;
            j["tokens"] = tokens ? json(*tokens) : json(nullptr);
            break;
        case Kind::Error:
            j["error"] = text;
            break;
    }
    // Replace rather than throw on invalid UTF-8 from upstream text
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_sse_frame(const ClientEvent& event) {
    return "data: " + event.to_json() + "\n\n";
}

bool EventEmitter::emit(const ClientEvent& event) {
    if (cancelled()) return false;
    if (!stream_.write(encode_sse_frame(event))) {
        failed_ = true;
        return false;
    }
    return true;
}

} // namespace chordrelay

#include "ndjson.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chordrelay {

bool NdjsonFramer::feed(const char* data, size_t len, const RecordCallback& callback) {
    if (stopped_) return false;
    buffer_ += decoder_.decode(data, len);
    return drain_lines(callback);
}

bool NdjsonFramer::finish(const RecordCallback& callback) {
    if (stopped_) return false;
    buffer_ += decoder_.flush();
    if (!drain_lines(callback)) return false;

    std::string rest;
    rest.swap(buffer_);
    return dispatch_line(rest, callback);
}

bool NdjsonFramer::drain_lines(const RecordCallback& callback) {
    size_t pos = 0;
    while (true) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!dispatch_line(line, callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }
    // Incomplete line - keep remainder in buffer
    buffer_.erase(0, pos);
    return true;
}

bool NdjsonFramer::dispatch_line(const std::string& line, const RecordCallback& callback) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return true;

    json payload = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        ++dropped_;
        return true;
    }

    if (payload.contains("error") && !payload["error"].is_null()) {
        const auto& err = payload["error"];
        std::string message = err.is_string() ? err.get<std::string>() : err.dump();
        if (!message.empty()) {
            error_ = std::move(message);
            stopped_ = true;
            return false;
        }
    }

    BackendRecord record;
    if (payload.contains("message") && payload["message"].is_object()) {
        const auto& msg = payload["message"];
        if (msg.contains("content") && msg["content"].is_string()) {
            record.delta = msg["content"].get<std::string>();
        }
    }
    if (payload.contains("done") && payload["done"].is_boolean()) {
        record.done = payload["done"].get<bool>();
    }
    if (payload.contains("eval_count") && payload["eval_count"].is_number_unsigned()) {
        record.eval_count = payload["eval_count"].get<uint64_t>();
    }

    if (!callback(record)) {
        stopped_ = true;
        return false;
    }
    return true;
}

} // namespace chordrelay

#pragma once
#include "../utf8.hpp"
#include <string>
#include <optional>
#include <functional>
#include <cstdint>

namespace chordrelay {

// One decoded object from a newline-delimited JSON stream.
struct BackendRecord {
    std::string delta;                  // message.content, empty if absent
    bool done = false;                  // terminal marker
    std::optional<uint64_t> eval_count; // usage counter, usually on the done record

    bool operator==(const BackendRecord& other) const {
        return delta == other.delta && done == other.done &&
               eval_count == other.eval_count;
    }
};

// Callback receives each record as soon as its line is complete.
// Return false to stop framing.
using RecordCallback = std::function<bool(const BackendRecord& record)>;

// Splits an arbitrarily chunked byte stream into NDJSON records.
//
// Lines that are blank or fail to parse as a JSON object are dropped and
// counted. A record with a non-empty "error" field ends framing and is
// kept in error(); the framer never throws, so it is safe to drive from
// inside an HTTP transfer callback.
class NdjsonFramer {
public:
    // Feed raw bytes. Returns false once the callback has asked to stop.
    bool feed(const char* data, size_t len, const RecordCallback& callback);
    bool feed(const std::string& chunk, const RecordCallback& callback) {
        return feed(chunk.data(), chunk.size(), callback);
    }

    // End of stream: parse whatever is left without a trailing newline.
    bool finish(const RecordCallback& callback);

    size_t dropped_count() const { return dropped_; }

    // Text of the upstream error record that stopped framing, if any.
    bool has_error() const { return !error_.empty(); }
    const std::string& error() const { return error_; }

private:
    bool drain_lines(const RecordCallback& callback);
    bool dispatch_line(const std::string& line, const RecordCallback& callback);

    Utf8Decoder decoder_;
    std::string buffer_;
    std::string error_;
    size_t dropped_ = 0;
    bool stopped_ = false;
};

} // namespace chordrelay

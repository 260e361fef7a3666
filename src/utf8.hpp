#pragma once
#include <string>
#include <cstddef>

namespace chordrelay {

// Incremental UTF-8 decoder. Bytes may arrive split anywhere, including in the
// middle of a multi-byte sequence; an incomplete tail is held until the next
// call. Malformed input is replaced with U+FFFD, so the decoded text is the
// same no matter how the input was chunked.
class Utf8Decoder {
public:
    // Decode a chunk, returning every complete character seen so far.
    std::string decode(const char* data, size_t len);
    std::string decode(const std::string& chunk) { return decode(chunk.data(), chunk.size()); }

    // End of input: any held partial sequence becomes U+FFFD.
    std::string flush();

private:
    std::string pending_;
};

} // namespace chordrelay

#include "utf8.hpp"

namespace chordrelay {

static const char kReplacement[] = "\xEF\xBF\xBD";

// Expected sequence length for a lead byte, 0 if it cannot start a sequence.
static size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Valid range of the second byte (stricter than 80..BF for a few leads,
// which rules out overlongs and surrogates).
static bool valid_second(unsigned char lead, unsigned char b) {
    switch (lead) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;
        case 0xED: return b >= 0x80 && b <= 0x9F;
        case 0xF0: return b >= 0x90 && b <= 0xBF;
        case 0xF4: return b >= 0x80 && b <= 0x8F;
        default:   return b >= 0x80 && b <= 0xBF;
    }
}

static bool is_continuation(unsigned char b) {
    return b >= 0x80 && b <= 0xBF;
}

std::string Utf8Decoder::decode(const char* data, size_t len) {
    std::string in;
    in.reserve(pending_.size() + len);
    in += pending_;
    in.append(data, len);
    pending_.clear();

    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        auto lead = static_cast<unsigned char>(in[i]);
        size_t need = sequence_length(lead);
        if (need == 0) {
            out += kReplacement;
            ++i;
            continue;
        }
        if (need == 1) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        // Walk the continuation bytes that are present.
        size_t got = 1;
        bool broken = false;
        while (got < need && i + got < in.size()) {
            auto b = static_cast<unsigned char>(in[i + got]);
            bool ok = (got == 1) ? valid_second(lead, b) : is_continuation(b);
            if (!ok) { broken = true; break; }
            ++got;
        }

        if (broken) {
            // Maximal-subpart replacement: one U+FFFD for the valid prefix.
            out += kReplacement;
            i += got;
            continue;
        }
        if (got < need) {
            // Input ends mid-sequence; wait for more bytes.
            pending_ = in.substr(i);
            break;
        }
        out.append(in, i, need);
        i += need;
    }
    return out;
}

std::string Utf8Decoder::flush() {
    if (pending_.empty()) return {};
    pending_.clear();
    return kReplacement;
}

} // namespace chordrelay

#include <catch2/catch.hpp>
#include "utf8.hpp"

using namespace chordrelay;

static const std::string kFffd = "\xEF\xBF\xBD";

TEST_CASE("Utf8Decoder: ASCII passes through", "[utf8]") {
    Utf8Decoder d;
    REQUIRE(d.decode("hello\n") == "hello\n");
    REQUIRE(d.flush().empty());
}

TEST_CASE("Utf8Decoder: multi-byte characters intact", "[utf8]") {
    Utf8Decoder d;
    // é (2 bytes), ♯ (3 bytes), 𝄞 (4 bytes)
    std::string text = "\xC3\xA9 \xE2\x99\xAF \xF0\x9D\x84\x9E";
    REQUIRE(d.decode(text) == text);
}

TEST_CASE("Utf8Decoder: character split across chunks is held", "[utf8]") {
    Utf8Decoder d;
    REQUIRE(d.decode("C\xE2\x99") == "C");
    REQUIRE(d.decode("\xAF!") == "\xE2\x99\xAF!");
}

TEST_CASE("Utf8Decoder: four-byte character split byte by byte", "[utf8]") {
    Utf8Decoder d;
    std::string out;
    for (char c : std::string("\xF0\x9D\x84\x9E")) {
        out += d.decode(&c, 1);
    }
    REQUIRE(out == "\xF0\x9D\x84\x9E");
}

TEST_CASE("Utf8Decoder: invalid bytes become U+FFFD", "[utf8]") {
    Utf8Decoder d;
    REQUIRE(d.decode("a\xFF" "b") == "a" + kFffd + "b");
    REQUIRE(d.decode("\xC0\xAF") == kFffd + kFffd);
}

TEST_CASE("Utf8Decoder: truncated sequence replaced by one U+FFFD", "[utf8]") {
    Utf8Decoder d;
    REQUIRE(d.decode("\xE2\x99X") == kFffd + "X");
}

TEST_CASE("Utf8Decoder: flush replaces held partial", "[utf8]") {
    Utf8Decoder d;
    REQUIRE(d.decode("ok\xE2\x99").size() == 2);
    REQUIRE(d.flush() == kFffd);
    REQUIRE(d.flush().empty());
}

TEST_CASE("Utf8Decoder: output independent of chunking", "[utf8]") {
    std::string input = "ab\xC3\xA9\xFF\xE2\x99\xAF\xED\xA0\x80z\xF0\x9D\x84\x9E\xE2";

    Utf8Decoder whole;
    std::string expected = whole.decode(input) + whole.flush();

    for (size_t cut = 0; cut <= input.size(); ++cut) {
        Utf8Decoder d;
        std::string out = d.decode(input.substr(0, cut));
        out += d.decode(input.substr(cut));
        out += d.flush();
        INFO("split at " << cut);
        REQUIRE(out == expected);
    }
}

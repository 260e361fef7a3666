#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

using namespace chordrelay;

// ── trim / to_lower / split ──────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("trim: all-whitespace and empty become empty", "[util]") {
    REQUIRE(trim(" \r\n\t ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("HeLLo-42") == "hello-42");
    REQUIRE(to_lower("\xc3\x89") == "\xc3\x89");
}

TEST_CASE("split: splits on delimiter keeping empty middles", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[1].empty());
    REQUIRE(parts[2] == "b");
}

TEST_CASE("split: empty input yields no parts", "[util]") {
    REQUIRE(split("", '/').empty());
}

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC", "[util]") {
    auto ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    std::string old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
    setenv("HOME", "/home/tester", 1);
    REQUIRE(expand_home("~/.chordrelay/agents") == "/home/tester/.chordrelay/agents");
    REQUIRE(expand_home("/abs/path") == "/abs/path");
    REQUIRE(expand_home("rel/~x") == "rel/~x");
    setenv("HOME", old_home.c_str(), 1);
}

// ── slugify ──────────────────────────────────────────────────────

TEST_CASE("slugify: lowercases and collapses separators", "[util]") {
    REQUIRE(slugify("Jazz Theory Tutor") == "jazz-theory-tutor");
    REQUIRE(slugify("  Bach & Sons!! ") == "bach-sons");
    REQUIRE(slugify("ii-V-I") == "ii-v-i");
}

TEST_CASE("slugify: non-ASCII only input falls back", "[util]") {
    REQUIRE(slugify("\xe5\x92\x8c\xe5\xa3\xb0") == "agent");
    REQUIRE(slugify("") == "agent");
    REQUIRE(slugify("---", 60, "x") == "x");
}

TEST_CASE("slugify: truncates without trailing dash", "[util]") {
    std::string label(59, 'a');
    label += " bcd";
    auto slug = slugify(label);
    REQUIRE(slug.size() <= 60);
    REQUIRE(slug.back() != '-');
    REQUIRE(slug == std::string(59, 'a'));
}

// ── atomic_write_file ────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "chordrelay_util_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static std::string read_all(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/nested/deeper/file.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(read_all(path) == "first");

    REQUIRE(atomic_write_file(path, "second"));
    REQUIRE(read_all(path) == "second");

    // No temp files left behind
    size_t count = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir + "/nested/deeper")) {
        (void)e;
        ++count;
    }
    REQUIRE(count == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: fails when parent is a file", "[util]") {
    auto dir = make_temp_dir();
    REQUIRE(atomic_write_file(dir + "/blocker", "x"));
    REQUIRE_FALSE(atomic_write_file(dir + "/blocker/child.txt", "y"));
    std::filesystem::remove_all(dir);
}

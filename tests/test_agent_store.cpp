#include <catch2/catch.hpp>
#include "agent_store.hpp"
#include "event_bus.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace chordrelay;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "chordrelay_agents_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII temp directory for one test case
struct TempAgentsDir {
    std::string root = make_temp_dir();
    std::string dir = root + "/agents";

    ~TempAgentsDir() { std::filesystem::remove_all(root); }

    void write(const std::string& name, const std::string& content) const {
        std::filesystem::create_directories(dir);
        std::ofstream f(dir + "/" + name);
        f << content;
    }

    std::string read(const std::string& name) const {
        std::ifstream f(dir + "/" + name);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

// ── extract_agent_label / is_safe_agent_id ──────────────────────

TEST_CASE("extract_agent_label: first heading wins", "[agents]") {
    REQUIRE(extract_agent_label("intro\n## Voice Leading Coach\n# Other", "x") == "Voice Leading Coach");
    REQUIRE(extract_agent_label("#NoSpace", "x") == "NoSpace");
}

TEST_CASE("extract_agent_label: fallback without usable heading", "[agents]") {
    REQUIRE(extract_agent_label("plain prompt", "fallback") == "fallback");
    REQUIRE(extract_agent_label("###   \nbody", "fallback") == "fallback");
    REQUIRE(extract_agent_label("", "fallback") == "fallback");
}

TEST_CASE("is_safe_agent_id: rejects traversal", "[agents]") {
    REQUIRE(is_safe_agent_id("jazz-tutor"));
    REQUIRE_FALSE(is_safe_agent_id(""));
    REQUIRE_FALSE(is_safe_agent_id(".."));
    REQUIRE_FALSE(is_safe_agent_id("../etc/passwd"));
    REQUIRE_FALSE(is_safe_agent_id("a/b"));
    REQUIRE_FALSE(is_safe_agent_id("a\\b"));
}

// ── list_agents ─────────────────────────────────────────────────

TEST_CASE("AgentStore: list creates missing directory", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    REQUIRE(store.list_agents().empty());
    REQUIRE(std::filesystem::is_directory(tmp.dir));
}

TEST_CASE("AgentStore: lists markdown profiles sorted by label", "[agents]") {
    TempAgentsDir tmp;
    tmp.write("zeta.md", "# Arranger\nWrite voicings.");
    tmp.write("alpha.MD", "No heading here");
    tmp.write("notes.txt", "# Ignored");

    AgentStore store(tmp.dir);
    auto agents = store.list_agents();
    REQUIRE(agents.size() == 2);
    REQUIRE(agents[0].id == "alpha");
    REQUIRE(agents[0].label == "alpha");
    REQUIRE(agents[1].id == "zeta");
    REQUIRE(agents[1].label == "Arranger");
    REQUIRE(agents[1].prompt == "# Arranger\nWrite voicings.");
}

// ── get_agent_prompt ────────────────────────────────────────────

TEST_CASE("AgentStore: get returns file content", "[agents]") {
    TempAgentsDir tmp;
    tmp.write("coach.md", "# Coach\nBe kind.");
    AgentStore store(tmp.dir);
    REQUIRE(store.get_agent_prompt("coach") == "# Coach\nBe kind.");
}

TEST_CASE("AgentStore: get missing or unsafe ids", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    REQUIRE_THROWS_AS(store.get_agent_prompt("nobody"), NotFound);
    REQUIRE_THROWS_AS(store.get_agent_prompt("../secret"), BadRequest);
    REQUIRE_THROWS_AS(store.get_agent_prompt(""), BadRequest);
}

// ── create_agent ────────────────────────────────────────────────

TEST_CASE("AgentStore: create writes heading and prompt", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);

    auto id = store.create_agent("  Jazz Theory Tutor ", "  Explain extensions.  ");
    REQUIRE(id == "jazz-theory-tutor");
    REQUIRE(tmp.read("jazz-theory-tutor.md") == "# Jazz Theory Tutor\n\nExplain extensions.");
}

TEST_CASE("AgentStore: create keeps prompt that already has a heading", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    auto id = store.create_agent("Bass", "# Bass Line Helper\nWalk it.");
    REQUIRE(tmp.read(id + ".md") == "# Bass Line Helper\nWalk it.");
}

TEST_CASE("AgentStore: create appends numeric suffix on collision", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    REQUIRE(store.create_agent("Coach", "one") == "coach");
    REQUIRE(store.create_agent("coach!", "two") == "coach-2");
    REQUIRE(store.create_agent("COACH", "three") == "coach-3");
    REQUIRE(store.list_agents().size() == 3);
}

TEST_CASE("AgentStore: create with non-ASCII label uses fallback id", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    REQUIRE(store.create_agent("\xe5\x92\x8c\xe5\xa3\xb0", "Harmony.") == "agent");
}

TEST_CASE("AgentStore: create rejects blank fields", "[agents]") {
    TempAgentsDir tmp;
    AgentStore store(tmp.dir);
    REQUIRE_THROWS_AS(store.create_agent("  ", "prompt"), BadRequest);
    REQUIRE_THROWS_AS(store.create_agent("Name", "\n"), BadRequest);
}

TEST_CASE("AgentStore: create publishes AgentCreated", "[agents]") {
    TempAgentsDir tmp;
    EventBus bus;
    std::string created;
    subscribe<AgentCreatedEvent>(bus, [&](const AgentCreatedEvent& ev) { created = ev.agent_id; });

    AgentStore store(tmp.dir, &bus);
    store.create_agent("Modal Guide", "Dorian first.");
    REQUIRE(created == "modal-guide");
}

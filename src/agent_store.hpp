#pragma once
#include <string>
#include <vector>
#include <mutex>

namespace chordrelay {

class EventBus;

struct AgentProfile {
    std::string id;     // file stem
    std::string label;  // first markdown heading, or the id
    std::string prompt; // full file content
};

// Agent profiles stored as markdown files in one directory.
class AgentStore {
public:
    explicit AgentStore(std::string directory, EventBus* bus = nullptr);

    // Every *.md profile, sorted by label. Creates the directory if missing.
    std::vector<AgentProfile> list_agents() const;

    // Throws BadRequest for an unsafe id, NotFound if no such profile.
    std::string get_agent_prompt(const std::string& id) const;

    // Writes a new profile and returns its id. Throws BadRequest when label
    // or prompt is blank, std::runtime_error when the file cannot be written.
    std::string create_agent(const std::string& label, const std::string& prompt);

    const std::string& directory() const { return directory_; }

private:
    void ensure_directory() const;
    std::string path_for(const std::string& id) const;

    std::string directory_;
    EventBus* bus_;
    std::mutex create_mutex_;
};

// Heading text of the first line starting with '#', hashes stripped.
std::string extract_agent_label(const std::string& content, const std::string& fallback);

// Rejects ids that could escape the profile directory.
bool is_safe_agent_id(const std::string& id);

} // namespace chordrelay

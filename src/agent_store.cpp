#include "agent_store.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace chordrelay {

std::string extract_agent_label(const std::string& content, const std::string& fallback) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] != '#') continue;
        size_t start = trimmed.find_first_not_of('#');
        std::string heading = start == std::string::npos ? "" : trim(trimmed.substr(start));
        return heading.empty() ? fallback : heading;
    }
    return fallback;
}

bool is_safe_agent_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    if (id.find("..") != std::string::npos) return false;
    return id.find_first_of("/\\") == std::string::npos &&
           id.find('\0') == std::string::npos;
}

static bool read_file(const fs::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    out = ss.str();
    return true;
}

AgentStore::AgentStore(std::string directory, EventBus* bus)
    : directory_(std::move(directory)), bus_(bus) {}

void AgentStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Unable to create agent directory " + directory_ +
                                 ": " + ec.message());
    }
}

std::string AgentStore::path_for(const std::string& id) const {
    return (fs::path(directory_) / (id + ".md")).string();
}

std::vector<AgentProfile> AgentStore::list_agents() const {
    ensure_directory();

    std::vector<AgentProfile> agents;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto& path = entry.path();
        if (to_lower(path.extension().string()) != ".md") continue;

        AgentProfile profile;
        profile.id = path.stem().string();
        if (!read_file(path, profile.prompt)) continue;
        profile.label = extract_agent_label(profile.prompt, profile.id);
        agents.push_back(std::move(profile));
    }
    if (ec) {
        throw std::runtime_error("Unable to read agent directory " + directory_ +
                                 ": " + ec.message());
    }

    std::sort(agents.begin(), agents.end(), [](const AgentProfile& a, const AgentProfile& b) {
        std::string la = to_lower(a.label), lb = to_lower(b.label);
        if (la != lb) return la < lb;
        return a.id < b.id;
    });
    return agents;
}

std::string AgentStore::get_agent_prompt(const std::string& id) const {
    if (id.empty()) throw BadRequest("Agent id is required.");
    if (!is_safe_agent_id(id)) throw BadRequest("Invalid agent id: " + id);

    std::string prompt;
    if (!read_file(path_for(id), prompt)) {
        throw NotFound("Agent profile not found: " + id);
    }
    return prompt;
}

std::string AgentStore::create_agent(const std::string& label, const std::string& prompt) {
    std::string name = trim(label);
    std::string text = trim(prompt);
    if (name.empty()) throw BadRequest("Agent name is required.");
    if (text.empty()) throw BadRequest("Agent prompt is required.");

    std::lock_guard<std::mutex> lock(create_mutex_);
    ensure_directory();

    std::string base = slugify(name);
    std::string candidate = base;
    for (int counter = 2; fs::exists(path_for(candidate)); ++counter) {
        candidate = base + "-" + std::to_string(counter);
    }

    std::string content = text[0] == '#' ? text : "# " + name + "\n\n" + text;
    if (!atomic_write_file(path_for(candidate), content)) {
        throw std::runtime_error("Unable to write agent profile " + path_for(candidate));
    }

    AgentCreatedEvent ev;
    ev.agent_id = candidate;
    publish_if(bus_, ev);
    return candidate;
}

} // namespace chordrelay

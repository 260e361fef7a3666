#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace chordrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"listen", "127.0.0.1:3001"},
        {"max_body", 1048576},
        {"agents_dir", "~/.chordrelay/agents"},
        {"backends", {
            {"ollama", {{"base_url", "http://127.0.0.1:11434"}}}
        }},
        {"relay", {
            {"stream_idle_timeout", 300},
            {"request_timeout", 120}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string config_file_path() {
    return expand_home("~/.chordrelay/config.json");
}

Config Config::load() {
    Config cfg;

    std::string config_path = config_file_path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::runtime_error("top-level value is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                } else {
                    std::cerr << "[config] Could not rewrite " << config_path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    // Parse JSON into Config struct
    if (j.contains("listen") && j["listen"].is_string())
        cfg.listen = j["listen"].get<std::string>();
    if (j.contains("max_body") && j["max_body"].is_number_unsigned())
        cfg.max_body = j["max_body"].get<uint32_t>();
    if (j.contains("agents_dir") && j["agents_dir"].is_string())
        cfg.agents_dir = j["agents_dir"].get<std::string>();

    if (j.contains("backends") && j["backends"].is_object()) {
        for (auto& [name, obj] : j["backends"].items()) {
            if (!obj.is_object()) continue;
            BackendEntry entry;
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.backends[name] = std::move(entry);
        }
    }

    if (j.contains("relay") && j["relay"].is_object()) {
        auto& r = j["relay"];
        if (r.contains("stream_idle_timeout") && r["stream_idle_timeout"].is_number_unsigned())
            cfg.relay.stream_idle_timeout = r["stream_idle_timeout"].get<uint32_t>();
        if (r.contains("request_timeout") && r["request_timeout"].is_number_unsigned())
            cfg.relay.request_timeout = r["request_timeout"].get<uint32_t>();
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.backends["ollama"].base_url = v;
    if (const char* v = std::getenv("CHORDRELAY_LISTEN"))
        cfg.listen = v;
    if (const char* v = std::getenv("CHORDRELAY_AGENTS_DIR"))
        cfg.agents_dir = v;

    return cfg;
}

std::string Config::base_url_for(const std::string& backend) const {
    auto it = backends.find(backend);
    if (it != backends.end()) return it->second.base_url;
    return {};
}

std::string Config::agents_path() const {
    return expand_home(agents_dir);
}

} // namespace chordrelay

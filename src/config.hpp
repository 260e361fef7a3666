#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chordrelay {

struct BackendEntry {
    std::string base_url;
};

struct RelayConfig {
    uint32_t stream_idle_timeout = 300; // seconds without upstream bytes
    uint32_t request_timeout = 120;     // non-streaming calls and model listing
};

struct Config {
    std::string listen = "127.0.0.1:3001";
    uint32_t max_body = 1048576;
    std::string agents_dir = "~/.chordrelay/agents";

    std::unordered_map<std::string, BackendEntry> backends;

    RelayConfig relay;

    // Load from ~/.chordrelay/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get base URL for a backend name (empty = use backend default)
    std::string base_url_for(const std::string& backend) const;

    // agents_dir with ~ expanded
    std::string agents_path() const;
};

// Path of the config file (~ expanded).
std::string config_file_path();

} // namespace chordrelay

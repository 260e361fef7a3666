#pragma once
#include "backend.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace chordrelay {

using BackendFactory = std::function<std::unique_ptr<Backend>(
    HttpClient& http, const BackendEntry& entry, const RelayConfig& relay)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_backend(const std::string& name, BackendFactory factory);

    std::unique_ptr<Backend> create_backend(const std::string& name,
                                            HttpClient& http,
                                            const Config& config) const;

    std::vector<std::string> backend_names() const;
    bool has_backend(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, BackendFactory> backends_;
};

// ── Self-registrar helper (used at file scope in each backend .cpp) ──

struct BackendRegistrar {
    BackendRegistrar(const std::string& name, BackendFactory factory) {
        PluginRegistry::instance().register_backend(name, std::move(factory));
    }
};

} // namespace chordrelay

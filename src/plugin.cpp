#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace chordrelay {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_backend(const std::string& name, BackendFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[name] = std::move(factory);
}

std::unique_ptr<Backend> PluginRegistry::create_backend(const std::string& name,
                                                         HttpClient& http,
                                                         const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(name);
    if (it == backends_.end()) {
        throw std::invalid_argument("Unknown backend: " + name);
    }
    static const BackendEntry kDefaultEntry{};
    auto entry_it = config.backends.find(name);
    const BackendEntry& entry = entry_it != config.backends.end()
        ? entry_it->second : kDefaultEntry;
    return it->second(http, entry, config.relay);
}

std::vector<std::string> PluginRegistry::backend_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(backends_.size());
    for (const auto& [name, _] : backends_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_backend(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.count(name) > 0;
}

} // namespace chordrelay

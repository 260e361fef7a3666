#include "catalog.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chordrelay {

std::vector<ProviderInfo> list_providers(const std::vector<Backend*>& backends) {
    std::vector<ProviderInfo> providers;
    providers.reserve(backends.size());

    for (Backend* backend : backends) {
        ProviderInfo info;
        info.id = backend->backend_name();
        info.label = backend->label();
        try {
            info.models = backend->list_models();
            info.available = !info.models.empty();
        } catch (const std::exception& e) {
            info.models.clear();
            info.available = false;
            info.error = e.what();
        }
        providers.push_back(std::move(info));
    }
    return providers;
}

json providers_to_json(const std::vector<ProviderInfo>& providers) {
    json list = json::array();
    for (const auto& p : providers) {
        json models = json::array();
        for (const auto& m : p.models) {
            models.push_back({{"id", m.id}, {"label", m.label}});
        }
        json entry = {
            {"id", p.id},
            {"label", p.label},
            {"available", p.available},
            {"models", models}
        };
        if (!p.error.empty()) entry["error"] = p.error;
        list.push_back(std::move(entry));
    }
    return json{{"providers", list}};
}

} // namespace chordrelay

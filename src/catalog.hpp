#pragma once
#include "backend.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace chordrelay {

struct ProviderInfo {
    std::string id;
    std::string label;
    bool available = false;
    std::vector<ModelInfo> models;
    std::string error; // set when the backend could not be queried
};

// Queries every backend for its models. A backend that fails is reported
// unavailable with the failure text instead of aborting the listing.
std::vector<ProviderInfo> list_providers(const std::vector<Backend*>& backends);

// {"providers":[{"id","label","available","models":[{"id","label"}],"error"?}]}
nlohmann::json providers_to_json(const std::vector<ProviderInfo>& providers);

} // namespace chordrelay

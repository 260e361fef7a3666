#include "backend.hpp"

namespace chordrelay {

std::optional<Role> role_from_string(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    return std::nullopt;
}

} // namespace chordrelay

#include "authority/alias.hpp"

namespace authority {

const Alias& AliasRegistry::add(std::string name, std::set<std::string> actions) {
    Alias alias { name, std::move(actions) };
    auto& slot = aliases_[std::move(name)];
    slot = std::move(alias);
    return slot;
}

std::vector<std::string> AliasRegistry::expand(const std::string& action) const {
    std::vector<std::string> actions { action };
    for (const auto& [name, alias] : aliases_) {
        if (alias.includes(action)) {
            actions.push_back(name);
        }
    }
    return actions;
}

std::optional<Alias> AliasRegistry::find(const std::string& name) const {
    auto it = aliases_.find(name);
    if (it == aliases_.end()) return std::nullopt;
    return it->second;
}

} // namespace authority

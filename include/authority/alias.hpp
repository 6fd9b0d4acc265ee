#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace authority {

// An Alias names a group of actions, e.g. "manage" -> {create, read, update, delete}.
struct Alias {
    std::string           name;
    std::set<std::string> actions;

    bool includes(const std::string& action) const { return actions.count(action) > 0; }
};

/**
 * AliasRegistry
 *
 * Stores aliases by name. Registering an existing name replaces its
 * definition; rules created earlier keep their raw action strings.
 *
 * Expansion is one level deep: expand("read") returns "read" plus every
 * alias that directly lists "read". Aliases listed inside other aliases
 * are not followed.
 */
class AliasRegistry {
public:
    const Alias& add(std::string name, std::set<std::string> actions);

    std::vector<std::string> expand(const std::string& action) const;

    std::optional<Alias> find(const std::string& name) const;

    const std::map<std::string, Alias>& all() const { return aliases_; }

    std::size_t size() const { return aliases_.size(); }

private:
    std::map<std::string, Alias> aliases_;
};

} // namespace authority

#include "authority/type_registry.hpp"

namespace authority {

std::optional<std::string> TypeRegistry::resolve(const Value& value) const {
    if (!value.has_value()) return std::nullopt;

    auto it = names_.find(std::type_index(value.type()));
    if (it == names_.end()) return std::nullopt;
    return it->second;
}

} // namespace authority

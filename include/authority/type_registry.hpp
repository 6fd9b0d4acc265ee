#pragma once

#include "authority/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace authority {

// Maps a resource value to the type name rules are written against.
// Returns std::nullopt when the value cannot be resolved.
using TypeResolver = std::function<std::optional<std::string>(const Value&)>;

/**
 * TypeRegistry
 *
 * Associates C++ types with resource type names so that
 * can("read", ResourceRef::of(user)) matches rules written for "User".
 */
class TypeRegistry {
public:
    template <class T>
    void register_type(std::string name) {
        names_[std::type_index(typeid(T))] = std::move(name);
    }

    /// Name registered for the value's concrete type; nullopt if empty or unknown.
    std::optional<std::string> resolve(const Value& value) const;

    std::size_t size() const { return names_.size(); }

private:
    std::map<std::type_index, std::string> names_;
};

} // namespace authority

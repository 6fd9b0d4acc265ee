#pragma once

#include <any>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace authority {

/// Opaque host value: the current user, a resource instance, an event payload entry.
/// An empty Value means "absent".
using Value = std::any;

/// Resource type sentinel matching every resource type.
inline const std::string kAllResources = "all";

enum class Behavior { Privilege, Restriction };

inline std::ostream& operator<<(std::ostream& os, Behavior b) {
    return os << (b == Behavior::Privilege ? "Privilege" : "Restriction");
}

/// Returns a pointer to the T held by value, or nullptr when empty or of another type.
template <class T>
const T* value_as(const Value& value) {
    return std::any_cast<T>(&value);
}

/**
 * ResourceRef
 *
 * Either a resource type name ("User") or a concrete resource value.
 * Strings convert implicitly to a type name; values are wrapped with
 * ResourceRef::of(v).
 */
class ResourceRef {
public:
    ResourceRef(std::string type_name) : ref_(std::move(type_name)) {}
    ResourceRef(const char* type_name) : ref_(std::string(type_name)) {}

    template <class T>
    static ResourceRef of(T value) {
        ResourceRef ref;
        ref.ref_ = Value(std::move(value));
        return ref;
    }

    bool is_type_name() const { return std::holds_alternative<std::string>(ref_); }

    const std::string& type_name() const { return std::get<std::string>(ref_); }
    const Value&       value() const     { return std::get<Value>(ref_); }

private:
    ResourceRef() = default;

    std::variant<std::string, Value> ref_;
};

/// Normalized form of a ResourceRef: always a type name, optionally a value.
struct ResolvedResource {
    std::string type_name;
    Value       value;
};

/// Event payload handed to the event sink, keyed by field name.
using EventPayload = std::map<std::string, Value>;

} // namespace authority

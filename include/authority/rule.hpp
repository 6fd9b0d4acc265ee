#pragma once

#include "authority/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace authority {

class Authority;

// A Predicate gates a rule. It receives the evaluating Authority (for the
// current user) and the resource value, which is empty when only a type
// name was supplied.
using Predicate = std::function<bool(const Authority&, const Value&)>;

/**
 * Rule
 *
 * Grants (Privilege) or refuses (Restriction) one action on one resource
 * type. A rule is relevant to a query when its action and resource type
 * match; it applies when every predicate also passes.
 */
class Rule {
public:
    Rule(Behavior behavior, std::string action, std::string resource,
         Predicate condition = nullptr);

    /// Appends a predicate. Empty predicates are ignored.
    Rule& when(Predicate condition);

    bool applies(const Authority& authority, const Value& value) const;

    /// Privilege that applies.
    bool is_allowed(const Authority& authority, const Value& value) const;
    /// Restriction that applies.
    bool is_disallowed(const Authority& authority, const Value& value) const;

    bool matches_action(const std::string& action) const;
    bool matches_action(const std::vector<std::string>& actions) const;
    bool matches_resource(const std::string& resource) const;
    bool is_relevant(const std::vector<std::string>& actions,
                     const std::string& resource) const;

    bool is_privilege() const   { return behavior_ == Behavior::Privilege; }
    bool is_restriction() const { return behavior_ == Behavior::Restriction; }

    Behavior           behavior() const        { return behavior_; }
    const std::string& action() const          { return action_; }
    const std::string& resource() const        { return resource_; }
    std::size_t        predicate_count() const { return predicates_.size(); }

private:
    Behavior               behavior_;
    std::string            action_;
    std::string            resource_;
    std::vector<Predicate> predicates_;
};

} // namespace authority

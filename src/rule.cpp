#include "authority/rule.hpp"

#include <algorithm>

namespace authority {

Rule::Rule(Behavior behavior, std::string action, std::string resource,
           Predicate condition)
    : behavior_(behavior), action_(std::move(action)), resource_(std::move(resource)) {
    when(std::move(condition));
}

Rule& Rule::when(Predicate condition) {
    if (condition) {
        predicates_.push_back(std::move(condition));
    }
    return *this;
}

bool Rule::applies(const Authority& authority, const Value& value) const {
    for (const auto& predicate : predicates_) {
        if (!predicate(authority, value)) return false;
    }
    return true;
}

bool Rule::is_allowed(const Authority& authority, const Value& value) const {
    return is_privilege() && applies(authority, value);
}

bool Rule::is_disallowed(const Authority& authority, const Value& value) const {
    return is_restriction() && applies(authority, value);
}

bool Rule::matches_action(const std::string& action) const {
    return action_ == action;
}

bool Rule::matches_action(const std::vector<std::string>& actions) const {
    return std::find(actions.begin(), actions.end(), action_) != actions.end();
}

bool Rule::matches_resource(const std::string& resource) const {
    return resource_ == resource || resource_ == kAllResources;
}

bool Rule::is_relevant(const std::vector<std::string>& actions,
                       const std::string& resource) const {
    return matches_action(actions) && matches_resource(resource);
}

} // namespace authority

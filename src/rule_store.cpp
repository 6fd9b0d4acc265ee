#include "authority/rule_store.hpp"

namespace authority {

Rule& RuleStore::add(Rule rule) {
    rules_.push_back(std::move(rule));
    return rules_.back();
}

RuleList RuleStore::relevant(const std::vector<std::string>& actions,
                             const std::string& resource) const {
    RuleList result;
    for (const auto& rule : rules_) {
        if (rule.is_relevant(actions, resource)) {
            result.push_back(&rule);
        }
    }
    return result;
}

RuleList RuleStore::all() const {
    RuleList result;
    result.reserve(rules_.size());
    for (const auto& rule : rules_) {
        result.push_back(&rule);
    }
    return result;
}

} // namespace authority

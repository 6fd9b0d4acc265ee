#pragma once

#include "authority/rule.hpp"
#include <deque>
#include <string>
#include <vector>

namespace authority {

/// Ordered view over stored rules, oldest first.
using RuleList = std::vector<const Rule*>;

/**
 * RuleStore
 *
 * Append-only log of rules. Insertion order is precedence order: the
 * later a rule was added, the earlier it is consulted. References
 * returned by add() stay valid for the lifetime of the store.
 */
class RuleStore {
public:
    Rule& add(Rule rule);

    /// Rules relevant to any of `actions` on `resource`, in insertion order.
    RuleList relevant(const std::vector<std::string>& actions,
                      const std::string& resource) const;

    RuleList all() const;

    std::size_t size() const { return rules_.size(); }
    bool        empty() const { return rules_.empty(); }

private:
    std::deque<Rule> rules_;
};

} // namespace authority

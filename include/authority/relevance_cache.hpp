#pragma once

#include "authority/rule_store.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace authority {

/**
 * RelevanceCache
 *
 * Memoizes the relevant rules per (action, resource type). Entries are a
 * derived index over a RuleStore and are never refreshed on their own:
 * the owner decides when to clear() them.
 *
 * Fills are serialized so concurrent readers never race on a miss.
 */
class RelevanceCache {
public:
    using Key  = std::pair<std::string, std::string>;
    using Fill = std::function<RuleList()>;

    RuleList get_or_fill(const std::string& action, const std::string& resource,
                         const Fill& fill);

    bool contains(const std::string& action, const std::string& resource) const;

    void clear();

    std::size_t size() const;

private:
    mutable std::mutex      mutex_;
    std::map<Key, RuleList> entries_;
};

} // namespace authority

#include "authority/relevance_cache.hpp"

#include <spdlog/spdlog.h>

namespace authority {

RuleList RelevanceCache::get_or_fill(const std::string& action,
                                     const std::string& resource,
                                     const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key { action, resource };

    auto it = entries_.find(key);
    if (it != entries_.end()) return it->second;

    RuleList rules = fill();
    spdlog::debug("authority: cached {} relevant rule(s) for '{}' on '{}'",
                  rules.size(), action, resource);
    return entries_.emplace(std::move(key), std::move(rules)).first->second;
}

bool RelevanceCache::contains(const std::string& action,
                              const std::string& resource) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(Key { action, resource }) > 0;
}

void RelevanceCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t RelevanceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace authority

#pragma once

#include "authority/alias.hpp"
#include "authority/relevance_cache.hpp"
#include "authority/rule.hpp"
#include "authority/rule_store.hpp"
#include "authority/type_registry.hpp"
#include "authority/types.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace authority {

// Receives lifecycle events ("authority.initialized"). The result is
// handed back to whoever dispatched the event.
using EventSink = std::function<std::optional<Value>(const std::string&, const EventPayload&)>;

// ── Configuration ─────────────────────────────────────────────────────────────

enum class CachePolicy {
    InvalidateOnChange, // clear cached relevance on every rule or alias insertion
    RetainOnChange      // keep entries until clear_cache(); later insertions may be missed
};

inline std::ostream& operator<<(std::ostream& os, CachePolicy p) {
    return os << (p == CachePolicy::InvalidateOnChange ? "InvalidateOnChange" : "RetainOnChange");
}

struct AuthorityOptions {
    CachePolicy cache_policy    = CachePolicy::InvalidateOnChange;
    bool        trace_decisions = false; // log every decision at debug level
};

// ── Trace types ───────────────────────────────────────────────────────────────

enum class StepOutcome { Privilege, Restriction, Skipped };

inline std::ostream& operator<<(std::ostream& os, StepOutcome o) {
    switch (o) {
        case StepOutcome::Privilege:   return os << "Privilege";
        case StepOutcome::Restriction: return os << "Restriction";
        case StepOutcome::Skipped:     return os << "Skipped";
        default:                       return os << "Unknown";
    }
}

struct RuleStep {
    std::size_t position;   // index among the relevant rules, oldest first
    std::string action;
    std::string resource;
    StepOutcome outcome;
};

struct EvaluationTrace {
    std::string              action;
    std::string              resource;   // resolved type name; empty when unresolved
    bool                     resolved = false;
    std::vector<std::string> actions;    // action plus covering aliases
    std::size_t              relevant_count = 0;
    std::vector<RuleStep>    steps;      // most recent rule first

    std::size_t skipped_count() const {
        std::size_t count = 0;
        for (const auto& s : steps)
            if (s.outcome == StepOutcome::Skipped) ++count;
        return count;
    }
};

struct EvaluationResult {
    bool            allowed = false;
    const Rule*     rule    = nullptr; // deciding rule; nullptr on default deny
    EvaluationTrace trace;
};

/**
 * Authority
 *
 * Answers "can the current user perform this action on this resource".
 *
 * Resolution strategy (last relevant rule wins):
 *   1. Collect the rules relevant to the action, its covering aliases and
 *      the resource type, in insertion order.
 *   2. Walk them from the most recently added to the oldest.
 *   3. The first rule whose predicates all pass decides: Privilege grants,
 *      Restriction denies.
 *   4. Default: Deny if no relevant rule applies.
 *
 * Not internally synchronized for writes: allow/deny/when/add_alias must not
 * run concurrently with can().
 */
class Authority {
public:
    explicit Authority(Value current_user, EventSink sink = nullptr,
                       AuthorityOptions options = {});

    Authority(const Authority&) = delete;
    Authority& operator=(const Authority&) = delete;

    // ── Decisions ──

    bool can(const std::string& action, const ResourceRef& resource,
             const Value& value = {}) const;

    bool cannot(const std::string& action, const ResourceRef& resource,
                const Value& value = {}) const;

    /// Same decision as can(), with a record of every rule consulted.
    EvaluationResult evaluate(const std::string& action, const ResourceRef& resource,
                              const Value& value = {}) const;

    /// Type name plus value for a resource reference; nullopt if the value's type is unknown.
    std::optional<ResolvedResource> resolve(const ResourceRef& resource,
                                            const Value& value = {}) const;

    // ── Rules ──

    Rule& allow(std::string action, std::string resource, Predicate condition = nullptr);
    Rule& deny(std::string action, std::string resource, Predicate condition = nullptr);
    Rule& add_rule(Behavior behavior, std::string action, std::string resource,
                   Predicate condition = nullptr);

    RuleList rules() const { return rules_.all(); }
    RuleList rules_for(const std::string& action, const std::string& resource) const;

    // ── Aliases ──

    const Alias& add_alias(std::string name, std::set<std::string> actions);

    const std::map<std::string, Alias>& aliases() const { return aliases_.all(); }
    std::optional<Alias> alias(const std::string& name) const { return aliases_.find(name); }
    std::vector<std::string> aliases_for_action(const std::string& action) const {
        return aliases_.expand(action);
    }

    // ── Resource types ──

    template <class T>
    void register_type(std::string name) { types_.register_type<T>(std::move(name)); }

    /// Replaces the type registry lookup. An empty resolver restores it.
    void set_type_resolver(TypeResolver resolver) { resolver_ = std::move(resolver); }

    // ── Principal & events ──

    void set_current_user(Value current_user) { current_user_ = std::move(current_user); }
    const Value& current_user() const { return current_user_; }
    const Value& user() const { return current_user_; }

    template <class T>
    const T* current_user_as() const { return value_as<T>(current_user_); }

    void set_event_sink(EventSink sink) { sink_ = std::move(sink); }
    std::optional<Value> dispatch(const std::string& event,
                                  const EventPayload& payload = {}) const;

    // ── Cache ──

    void clear_cache() { cache_.clear(); }
    std::size_t cached_entries() const { return cache_.size(); }

    const AuthorityOptions& options() const { return options_; }

private:
    const Rule* decide(const std::string& action, const ResolvedResource& resource,
                       EvaluationTrace* trace) const;

    void invalidate();

    Value                  current_user_;
    EventSink              sink_;
    AuthorityOptions       options_;
    RuleStore              rules_;
    AliasRegistry          aliases_;
    TypeRegistry           types_;
    TypeResolver           resolver_;
    mutable RelevanceCache cache_;
};

} // namespace authority

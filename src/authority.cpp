#include "authority/authority.hpp"

#include <spdlog/spdlog.h>

namespace authority {

Authority::Authority(Value current_user, EventSink sink, AuthorityOptions options)
    : current_user_(std::move(current_user)),
      sink_(std::move(sink)),
      options_(options) {
    spdlog::info("authority: initialized (cache policy {})",
                 options_.cache_policy == CachePolicy::InvalidateOnChange
                     ? "invalidate-on-change" : "retain-on-change");
    dispatch("authority.initialized", EventPayload{ { "user", current_user_ } });
}

// ── Decisions ─────────────────────────────────────────────────────────────────

std::optional<ResolvedResource> Authority::resolve(const ResourceRef& resource,
                                                   const Value& value) const {
    if (resource.is_type_name()) {
        return ResolvedResource{ resource.type_name(), value };
    }

    // A resource value replaces any separately supplied value.
    const Value& instance = resource.value();
    auto type_name = resolver_ ? resolver_(instance) : types_.resolve(instance);
    if (!type_name) return std::nullopt;
    return ResolvedResource{ *type_name, instance };
}

bool Authority::can(const std::string& action, const ResourceRef& resource,
                    const Value& value) const {
    auto resolved = resolve(resource, value);
    if (!resolved) {
        spdlog::warn("authority: cannot resolve resource type of '{}' for action '{}', denying",
                     resource.value().type().name(), action);
        return false;
    }

    const Rule* rule = decide(action, *resolved, nullptr);
    bool allowed = rule != nullptr && rule->is_privilege();

    if (options_.trace_decisions) {
        spdlog::debug("authority: {} '{}' on '{}' ({})",
                      allowed ? "allow" : "deny", action, resolved->type_name,
                      rule ? "rule " + rule->action() + ":" + rule->resource()
                           : std::string("default"));
    }
    return allowed;
}

bool Authority::cannot(const std::string& action, const ResourceRef& resource,
                       const Value& value) const {
    return !can(action, resource, value);
}

EvaluationResult Authority::evaluate(const std::string& action, const ResourceRef& resource,
                                     const Value& value) const {
    EvaluationResult result;
    result.trace.action = action;

    auto resolved = resolve(resource, value);
    if (!resolved) {
        spdlog::warn("authority: cannot resolve resource type of '{}' for action '{}', denying",
                     resource.value().type().name(), action);
        result.trace.actions = aliases_.expand(action);
        return result;
    }

    result.trace.resource = resolved->type_name;
    result.trace.resolved = true;
    result.rule    = decide(action, *resolved, &result.trace);
    result.allowed = result.rule != nullptr && result.rule->is_privilege();
    return result;
}

const Rule* Authority::decide(const std::string& action, const ResolvedResource& resource,
                              EvaluationTrace* trace) const {
    RuleList relevant = rules_for(action, resource.type_name);
    if (trace) {
        trace->actions        = aliases_.expand(action);
        trace->relevant_count = relevant.size();
    }

    // Most recently added rule first.
    for (std::size_t i = relevant.size(); i-- > 0;) {
        const Rule* rule = relevant[i];
        bool applied = rule->applies(*this, resource.value);

        if (trace) {
            StepOutcome outcome = !applied ? StepOutcome::Skipped
                                : rule->is_privilege() ? StepOutcome::Privilege
                                : StepOutcome::Restriction;
            trace->steps.push_back({ i, rule->action(), rule->resource(), outcome });
        }
        if (applied) return rule;
    }
    return nullptr;
}

// ── Rules & aliases ───────────────────────────────────────────────────────────

Rule& Authority::allow(std::string action, std::string resource, Predicate condition) {
    return add_rule(Behavior::Privilege, std::move(action), std::move(resource),
                    std::move(condition));
}

Rule& Authority::deny(std::string action, std::string resource, Predicate condition) {
    return add_rule(Behavior::Restriction, std::move(action), std::move(resource),
                    std::move(condition));
}

Rule& Authority::add_rule(Behavior behavior, std::string action, std::string resource,
                          Predicate condition) {
    spdlog::debug("authority: add {} '{}' on '{}'",
                  behavior == Behavior::Privilege ? "privilege" : "restriction",
                  action, resource);
    Rule& rule = rules_.add(Rule(behavior, std::move(action), std::move(resource),
                                 std::move(condition)));
    invalidate();
    return rule;
}

RuleList Authority::rules_for(const std::string& action, const std::string& resource) const {
    return cache_.get_or_fill(action, resource, [&] {
        return rules_.relevant(aliases_.expand(action), resource);
    });
}

const Alias& Authority::add_alias(std::string name, std::set<std::string> actions) {
    spdlog::debug("authority: alias '{}' covers {} action(s)", name, actions.size());
    const Alias& alias = aliases_.add(std::move(name), std::move(actions));
    invalidate();
    return alias;
}

void Authority::invalidate() {
    if (options_.cache_policy == CachePolicy::InvalidateOnChange) {
        cache_.clear();
    }
}

// ── Events ────────────────────────────────────────────────────────────────────

std::optional<Value> Authority::dispatch(const std::string& event,
                                         const EventPayload& payload) const {
    if (!sink_) return std::nullopt;
    spdlog::debug("authority: dispatch '{}'", event);
    return sink_(event, payload);
}

} // namespace authority

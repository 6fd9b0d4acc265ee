#include "authority/authority.hpp"
#include "authority/json.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace authority;

namespace {

struct User {
    int         id;
    std::string name;
};

struct Scenario {
    std::string action;
    ResourceRef resource;
    Value       value;
    std::string label;
};

std::string verdict(bool allowed) {
    return allowed ? "[ALLOW]" : "[DENY] ";
}

std::string outcome_str(StepOutcome o) {
    switch (o) {
        case StepOutcome::Privilege:   return "Privilege  ";
        case StepOutcome::Restriction: return "Restriction";
        case StepOutcome::Skipped:     return "Skipped    ";
        default:                       return "Unknown    ";
    }
}

void print_trace(const EvaluationTrace& trace) {
    std::cout << "  Actions  :";
    for (const auto& a : trace.actions) std::cout << " " << a;
    std::cout << "\n  Steps:\n";
    for (const auto& step : trace.steps) {
        std::cout << "    [" << outcome_str(step.outcome) << "] #"
                  << step.position << " " << step.action << " on " << step.resource << "\n";
    }
}

void separator(const std::string& title) {
    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << title << "\n"
              << std::string(55, '-') << "\n";
}

} // namespace

int main() {
    User me    { 1, "me" };
    User other { 2, "other" };

    // ── Build Authority ──────────────────────────────────────────────────────
    Authority auth(me, [](const std::string& event, const EventPayload& payload) {
        std::cout << "  event: " << event << " (" << payload.size() << " field(s))\n";
        return std::optional<Value>{};
    });
    auth.register_type<User>("User");

    auth.add_alias("manage", { "create", "update", "index", "read", "delete" });

    // Everyone may read users; managing is limited to one's own record.
    auth.allow("read", "User");
    auth.allow("manage", "User", [](const Authority& self, const Value& value) {
        const auto* current = self.current_user_as<User>();
        const auto* target  = value_as<User>(value);
        return current && target && current->id == target->id;
    });
    auth.deny("delete", "User").when([](const Authority&, const Value& value) {
        const auto* target = value_as<User>(value);
        return target && target->name == "root";
    });

    // ── Access Control Scenarios ─────────────────────────────────────────────
    separator("ACCESS CONTROL EVALUATION");

    std::vector<Scenario> scenarios = {
        { "read",   "User",                 {},    "read any user"       },
        { "read",   ResourceRef::of(other), {},    "read other user"     },
        { "update", "User",                 other, "update other user"   },
        { "delete", "User",                 me,    "delete own user"     },
        { "delete", "User",                 User{ 3, "root" }, "delete root" },
        { "launch", "Rocket",               {},    "unknown resource"    },
    };

    for (const auto& s : scenarios) {
        std::cout << "  " << verdict(auth.can(s.action, s.resource, s.value))
                  << " " << s.label << "\n";
    }

    // ── Evaluation Trace ─────────────────────────────────────────────────────
    separator("EVALUATION TRACE");

    {
        auto result = auth.evaluate("delete", "User", other);
        std::cout << "\n  Decision : " << verdict(result.allowed) << "\n";
        print_trace(result.trace);
    }

    // ── JSON Output ──────────────────────────────────────────────────────────
    separator("JSON OUTPUT");

    std::cout << "\n" << to_json(auth.evaluate("delete", "User", me)) << "\n";

    std::cout << "\n" << std::string(55, '-') << "\n"
              << "  " << auth.rules().size() << " rule(s), "
              << auth.aliases().size() << " alias(es).\n"
              << std::string(55, '-') << "\n\n";
    return 0;
}

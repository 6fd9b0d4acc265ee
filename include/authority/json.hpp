#pragma once

#include "authority/authority.hpp"

#include <sstream>
#include <string>

namespace authority {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:   result += c;      break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string outcome_str(StepOutcome o) {
    switch (o) {
        case StepOutcome::Privilege:   return "Privilege";
        case StepOutcome::Restriction: return "Restriction";
        case StepOutcome::Skipped:     return "Skipped";
        default:                       return "Unknown";
    }
}

} // namespace json_detail

inline std::string to_json(const RuleStep& step) {
    std::ostringstream os;
    os << "{ \"position\": " << step.position
       << ", \"action\": "   << json_detail::quoted(step.action)
       << ", \"resource\": " << json_detail::quoted(step.resource)
       << ", \"outcome\": "  << json_detail::quoted(json_detail::outcome_str(step.outcome))
       << " }";
    return os.str();
}

/// Diagnostic rendering of a decision and the rules consulted for it.
inline std::string to_json(const EvaluationResult& result) {
    std::ostringstream os;
    const auto& t = result.trace;
    os << "{\n"
       << "  \"allowed\": " << (result.allowed ? "true" : "false") << ",\n"
       << "  \"decided_by\": ";
    if (result.rule) {
        os << "{ \"action\": "   << json_detail::quoted(result.rule->action())
           << ", \"resource\": " << json_detail::quoted(result.rule->resource())
           << " }";
    } else {
        os << "\"default\"";
    }
    os << ",\n"
       << "  \"trace\": {\n"
       << "    \"action\": "   << json_detail::quoted(t.action) << ",\n"
       << "    \"resource\": " << json_detail::quoted(t.resource) << ",\n"
       << "    \"resolved\": " << (t.resolved ? "true" : "false") << ",\n"
       << "    \"actions\": [";
    for (std::size_t i = 0; i < t.actions.size(); ++i) {
        os << json_detail::quoted(t.actions[i]);
        if (i + 1 < t.actions.size()) os << ", ";
    }
    os << "],\n"
       << "    \"relevant_count\": " << t.relevant_count << ",\n"
       << "    \"steps\": [";
    for (std::size_t i = 0; i < t.steps.size(); ++i) {
        os << "\n      " << to_json(t.steps[i]);
        if (i + 1 < t.steps.size()) os << ",";
    }
    os << "\n    ]\n"
       << "  }\n"
       << "}";
    return os.str();
}

} // namespace authority

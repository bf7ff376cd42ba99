#include "core/lifecycle_queries.hpp"

namespace core {

StateSet valid_next_states(ProjectState current, Role role) noexcept {
    StateSet out{};
    if (!is_known_state(current) || !is_known_role(role)) {
        return out;
    }
    for (const auto& rule : transition_table()) {
        if (rule.from == current && rule.allowed_roles.contains(role)) {
            out.insert(rule.to);
        }
    }
    return out;
}

std::optional<TransitionRule> transition_info(ProjectState from, ProjectState to) noexcept {
    if (const auto* rule = find_rule(from, to)) {
        return *rule;
    }
    return std::nullopt;
}

bool requires_approval(ProjectState from, ProjectState to) noexcept {
    const auto* rule = find_rule(from, to);
    return rule != nullptr && rule->requires_approval;
}

std::string transition_description(ProjectState from, ProjectState to) {
    if (const auto* rule = find_rule(from, to)) {
        return std::string(rule->description);
    }
    std::string text = "move from ";
    text += to_string(from);
    text += " to ";
    text += to_string(to);
    return text;
}

std::vector<TransitionRule> outgoing_rules(ProjectState from) {
    std::vector<TransitionRule> out;
    for (const auto& rule : transition_table()) {
        if (rule.from == from) {
            out.push_back(rule);
        }
    }
    return out;
}

} // namespace core

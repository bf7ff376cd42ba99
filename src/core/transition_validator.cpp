#include "core/transition_validator.hpp"

#include <utility>

namespace core {

namespace {

TransitionDecision reject(std::string message) {
    TransitionDecision d{};
    d.valid = false;
    d.error = std::move(message);
    return d;
}

} // namespace

TransitionDecision validate_transition(ProjectState current, ProjectState target, Role role) {
    if (!is_known_state(current) || !is_known_state(target)) {
        return reject("unknown project state");
    }
    if (!is_known_role(role)) {
        return reject("unknown role");
    }

    if (current == target) {
        TransitionDecision d{};
        d.valid = true;
        return d;
    }

    const TransitionRule* rule = find_rule(current, target);
    if (!rule) {
        std::string msg = "transition from ";
        msg += to_string(current);
        msg += " to ";
        msg += to_string(target);
        msg += " not allowed";
        return reject(std::move(msg));
    }

    if (!rule->allowed_roles.contains(role)) {
        std::string msg = "role '";
        msg += to_string(role);
        msg += "' cannot perform this transition; required one of: ";
        msg += rule->allowed_roles.to_string();
        return reject(std::move(msg));
    }

    TransitionDecision d{};
    d.valid = true;
    d.rule = rule;
    return d;
}

} // namespace core

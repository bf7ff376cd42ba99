#pragma once

#include <optional>
#include <string>

#include "core/project_state.hpp"
#include "core/transition_table.hpp"

namespace core {

// Result of asking whether a move is admissible. A disallowed move is ordinary
// data, never an exception.
struct TransitionDecision {
    bool valid{false};
    std::optional<std::string> error{};
    // Points into the static transition table. Null for the idempotent
    // same-state case and for every invalid decision.
    const TransitionRule* rule{nullptr};

    explicit operator bool() const noexcept { return valid; }
    bool is_noop() const noexcept { return valid && rule == nullptr; }
};

// Same-state requests are always valid and are checked before any lookup.
TransitionDecision validate_transition(ProjectState current, ProjectState target, Role role);

inline bool can_transition(ProjectState current, ProjectState target, Role role) {
    return validate_transition(current, target, role).valid;
}

// Mutates `current` only when the decision is valid.
inline TransitionDecision apply_transition(ProjectState& current, ProjectState target, Role role) {
    auto decision = validate_transition(current, target, role);
    if (decision.valid) {
        current = target;
    }
    return decision;
}

} // namespace core

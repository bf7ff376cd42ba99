#pragma once

#include <span>
#include <string_view>

#include "core/enum_set.hpp"
#include "core/project_state.hpp"

namespace core {

// One admissible edge of the project lifecycle graph.
struct TransitionRule {
    ProjectState from{ProjectState::Requested};
    ProjectState to{ProjectState::Requested};
    RoleSet allowed_roles{};
    bool requires_approval{false};
    std::string_view description{};
};

// The complete, immutable catalogue of legal moves. There is at most one rule
// per (from, to) pair; this is checked at compile time.
std::span<const TransitionRule> transition_table() noexcept;

// O(1) lookup through a dense (from, to) index. Returns nullptr when no rule
// exists or either state is out of range.
const TransitionRule* find_rule(ProjectState from, ProjectState to) noexcept;

} // namespace core

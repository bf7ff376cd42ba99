#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/enum_set.hpp"
#include "core/project_state.hpp"
#include "core/transition_table.hpp"

namespace core {

// Read-only views over the transition table, used to render "what can I do
// next" controls and confirmation dialogs.

// Every target reachable from `current` in one hop by `role`. The idempotent
// self-move is not listed since no rule backs it.
StateSet valid_next_states(ProjectState current, Role role) noexcept;

// Direct lookup, independent of role.
std::optional<TransitionRule> transition_info(ProjectState from, ProjectState to) noexcept;

// False when no rule matches.
bool requires_approval(ProjectState from, ProjectState to) noexcept;

// Advisory text; falls back to "move from <from> to <to>" when no rule matches.
std::string transition_description(ProjectState from, ProjectState to);

// All rules leaving `from`, regardless of role, in table order.
std::vector<TransitionRule> outgoing_rules(ProjectState from);

// The canonical forward-only progression, for progress displays. Not used for
// validation. Same storage as all_project_states.
inline constexpr const std::array<ProjectState, project_state_count>& happy_path() noexcept {
    return all_project_states;
}

// Position of `s` on the happy path, or nullopt for an out-of-range value.
inline constexpr std::optional<std::size_t> happy_path_index(ProjectState s) noexcept {
    const auto& path = happy_path();
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == s) {
            return i;
        }
    }
    return std::nullopt;
}

inline constexpr StateSet terminal_states() noexcept {
    return StateSet{ProjectState::Approved, ProjectState::Archived};
}

// States at which external payout logic may trigger.
inline constexpr StateSet payout_eligible_states() noexcept {
    return StateSet{ProjectState::Approved};
}

inline constexpr bool is_terminal_state(ProjectState s) noexcept { return terminal_states().contains(s); }
inline constexpr bool is_payout_eligible(ProjectState s) noexcept { return payout_eligible_states().contains(s); }

} // namespace core

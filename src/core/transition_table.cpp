#include "core/transition_table.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace core {

namespace {

using PS = ProjectState;

constexpr std::array<TransitionRule, 15> rules{{
    // Forward path.
    {PS::Requested, PS::Assigned, {Role::Admin, Role::SalesLead}, false, "Assign technician to project"},
    {PS::Assigned, PS::Captured, {Role::Technician}, false, "Upload captured photos"},
    {PS::Captured, PS::Processing, {Role::Technician, Role::Admin}, false, "Start processing raw files"},
    {PS::Processing, PS::QA, {Role::Technician, Role::Admin}, false, "Submit for quality assurance"},
    {PS::QA, PS::Delivered, {Role::Approver}, true, "Approve quality, ready for customer"},
    {PS::Delivered, PS::Approved, {Role::CustomerOwner}, true, "Customer approves outcome, trigger payout"},
    {PS::Approved, PS::Archived, {Role::Admin, Role::Approver}, false, "Archive completed project"},

    // Reject loops back to capture.
    {PS::QA, PS::Captured, {Role::Approver}, false, "Reject QA, request retake"},
    {PS::Delivered, PS::Captured, {Role::CustomerOwner}, false, "Customer rejects, request retake"},

    // Cancellation. The role set narrows per originating state.
    {PS::Requested, PS::Archived, {Role::Admin, Role::SalesLead, Role::CustomerOwner}, false, "Cancel project"},
    {PS::Assigned, PS::Archived, {Role::Admin, Role::SalesLead}, false, "Cancel assigned project"},
    {PS::Captured, PS::Archived, {Role::Admin, Role::SalesLead}, false, "Cancel project"},
    {PS::Processing, PS::Archived, {Role::Admin, Role::SalesLead}, false, "Cancel project"},
    {PS::QA, PS::Archived, {Role::Admin, Role::Approver}, false, "Cancel project"},
    {PS::Delivered, PS::Archived, {Role::Admin, Role::SalesLead, Role::CustomerOwner}, false, "Cancel project"},
}};

constexpr std::int8_t no_rule = -1;

using RuleIndex = std::array<std::array<std::int8_t, project_state_count>, project_state_count>;

constexpr RuleIndex build_index() noexcept {
    RuleIndex idx{};
    for (auto& row : idx) {
        row.fill(no_rule);
    }
    for (std::size_t i = 0; i < rules.size(); ++i) {
        idx[state_index(rules[i].from)][state_index(rules[i].to)] = static_cast<std::int8_t>(i);
    }
    return idx;
}

constexpr bool edges_are_unique() noexcept {
    for (std::size_t i = 0; i < rules.size(); ++i) {
        for (std::size_t j = i + 1; j < rules.size(); ++j) {
            if (rules[i].from == rules[j].from && rules[i].to == rules[j].to) {
                return false;
            }
        }
    }
    return true;
}

constexpr bool rules_well_formed() noexcept {
    for (const auto& r : rules) {
        if (!is_known_state(r.from) || !is_known_state(r.to) || r.from == r.to || r.allowed_roles.empty()) {
            return false;
        }
        if (r.from == PS::Archived) {
            return false;
        }
        if (r.from == PS::Approved && r.to != PS::Archived) {
            return false;
        }
    }
    return true;
}

static_assert(edges_are_unique(), "transition table must hold at most one rule per (from, to)");
static_assert(rules_well_formed(), "transition table holds a malformed or non-terminal-violating rule");

constexpr RuleIndex rule_index = build_index();

} // namespace

std::span<const TransitionRule> transition_table() noexcept { return rules; }

const TransitionRule* find_rule(ProjectState from, ProjectState to) noexcept {
    if (!is_known_state(from) || !is_known_state(to)) {
        return nullptr;
    }
    const auto slot = rule_index[state_index(from)][state_index(to)];
    return slot == no_rule ? nullptr : &rules[static_cast<std::size_t>(slot)];
}

} // namespace core

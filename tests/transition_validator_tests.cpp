#include <gtest/gtest.h>

#include "core/transition_validator.hpp"

namespace {

using core::ProjectState;
using core::Role;

TEST(TransitionValidatorTest, SameStateIsAlwaysValid) {
    for (const auto s : core::all_project_states) {
        for (const auto r : core::all_roles) {
            const auto d = core::validate_transition(s, s, r);
            EXPECT_TRUE(d.valid) << core::to_string(s) << "/" << core::to_string(r);
            EXPECT_TRUE(d.is_noop());
            EXPECT_FALSE(d.error.has_value());
            EXPECT_EQ(d.rule, nullptr);
        }
    }
}

TEST(TransitionValidatorTest, NoShortcutsForAnyRole) {
    for (const auto from : core::all_project_states) {
        for (const auto to : core::all_project_states) {
            if (from == to || core::find_rule(from, to) != nullptr) {
                continue;
            }
            for (const auto r : core::all_roles) {
                EXPECT_FALSE(core::validate_transition(from, to, r).valid)
                    << core::to_string(from) << " -> " << core::to_string(to);
            }
        }
    }
    EXPECT_FALSE(core::validate_transition(ProjectState::Requested, ProjectState::Processing, Role::Admin).valid);
}

TEST(TransitionValidatorTest, MissingRuleMessage) {
    const auto d = core::validate_transition(ProjectState::Requested, ProjectState::Delivered, Role::Admin);
    ASSERT_FALSE(d.valid);
    ASSERT_TRUE(d.error.has_value());
    EXPECT_EQ(*d.error, "transition from Requested to Delivered not allowed");
    EXPECT_EQ(d.rule, nullptr);
}

TEST(TransitionValidatorTest, RoleGating) {
    const auto denied = core::validate_transition(ProjectState::QA, ProjectState::Delivered, Role::CustomerOwner);
    ASSERT_FALSE(denied.valid);
    EXPECT_EQ(*denied.error, "role 'customer_owner' cannot perform this transition; required one of: approver");

    const auto allowed = core::validate_transition(ProjectState::QA, ProjectState::Delivered, Role::Approver);
    EXPECT_TRUE(allowed.valid);
}

TEST(TransitionValidatorTest, RejectLoopsAreReachable) {
    EXPECT_TRUE(core::validate_transition(ProjectState::QA, ProjectState::Captured, Role::Approver).valid);
    EXPECT_TRUE(
        core::validate_transition(ProjectState::Delivered, ProjectState::Captured, Role::CustomerOwner).valid);
}

TEST(TransitionValidatorTest, AdminAssignmentNeedsNoApproval) {
    const auto d = core::validate_transition(ProjectState::Requested, ProjectState::Assigned, Role::Admin);
    ASSERT_TRUE(d.valid);
    ASSERT_NE(d.rule, nullptr);
    EXPECT_FALSE(d.rule->requires_approval);
    EXPECT_FALSE(d.is_noop());
}

TEST(TransitionValidatorTest, QaSignOffRequiresApproval) {
    const auto d = core::validate_transition(ProjectState::QA, ProjectState::Delivered, Role::Approver);
    ASSERT_TRUE(d.valid);
    ASSERT_NE(d.rule, nullptr);
    EXPECT_TRUE(d.rule->requires_approval);
    EXPECT_EQ(d.rule->description, "Approve quality, ready for customer");
}

TEST(TransitionValidatorTest, TechnicianCannotArchive) {
    const auto d = core::validate_transition(ProjectState::Processing, ProjectState::Archived, Role::Technician);
    ASSERT_FALSE(d.valid);
    EXPECT_EQ(*d.error, "role 'technician' cannot perform this transition; required one of: admin, sales_lead");
}

TEST(TransitionValidatorTest, ArchivedIsTerminal) {
    for (const auto to : core::all_project_states) {
        if (to == ProjectState::Archived) {
            continue;
        }
        for (const auto r : core::all_roles) {
            EXPECT_FALSE(core::validate_transition(ProjectState::Archived, to, r).valid);
        }
    }
}

TEST(TransitionValidatorTest, UnknownEnumsYieldInvalidDecision) {
    const auto bad_state = core::validate_transition(static_cast<ProjectState>(99), ProjectState::QA, Role::Admin);
    EXPECT_FALSE(bad_state.valid);
    EXPECT_EQ(*bad_state.error, "unknown project state");

    // Checked before the same-state shortcut.
    const auto same_bad = core::validate_transition(static_cast<ProjectState>(99), static_cast<ProjectState>(99),
                                                    Role::Admin);
    EXPECT_FALSE(same_bad.valid);

    const auto bad_role = core::validate_transition(ProjectState::QA, ProjectState::QA, static_cast<Role>(7));
    EXPECT_FALSE(bad_role.valid);
    EXPECT_EQ(*bad_role.error, "unknown role");
}

TEST(TransitionValidatorTest, ApplyMutatesOnlyOnSuccess) {
    ProjectState s = ProjectState::Assigned;
    EXPECT_FALSE(core::apply_transition(s, ProjectState::Captured, Role::Admin).valid);
    EXPECT_EQ(s, ProjectState::Assigned);

    EXPECT_TRUE(core::apply_transition(s, ProjectState::Captured, Role::Technician).valid);
    EXPECT_EQ(s, ProjectState::Captured);

    EXPECT_TRUE(core::can_transition(s, ProjectState::Processing, Role::Admin));
    EXPECT_FALSE(core::can_transition(s, ProjectState::QA, Role::Admin));
}

TEST(TransitionValidatorTest, DecisionConvertsToBool) {
    EXPECT_TRUE(static_cast<bool>(core::validate_transition(ProjectState::Delivered, ProjectState::Approved,
                                                            Role::CustomerOwner)));
    EXPECT_FALSE(static_cast<bool>(core::validate_transition(ProjectState::Delivered, ProjectState::Approved,
                                                             Role::Admin)));
}

} // namespace

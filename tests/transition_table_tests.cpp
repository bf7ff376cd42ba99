#include <gtest/gtest.h>

#include <set>
#include <utility>

#include "core/transition_table.hpp"

namespace {

using core::ProjectState;
using core::Role;

TEST(TransitionTableTest, HoldsFifteenUniqueEdges) {
    const auto table = core::transition_table();
    EXPECT_EQ(table.size(), 15u);

    std::set<std::pair<ProjectState, ProjectState>> edges;
    for (const auto& rule : table) {
        EXPECT_TRUE(edges.emplace(rule.from, rule.to).second)
            << core::to_string(rule.from) << " -> " << core::to_string(rule.to) << " listed twice";
        EXPECT_NE(rule.from, rule.to);
        EXPECT_FALSE(rule.allowed_roles.empty());
        EXPECT_FALSE(rule.description.empty());
    }
}

TEST(TransitionTableTest, ArchivedHasNoOutgoingEdges) {
    for (const auto& rule : core::transition_table()) {
        EXPECT_NE(rule.from, ProjectState::Archived);
    }
}

TEST(TransitionTableTest, ApprovedOnlyLeadsToArchived) {
    for (const auto& rule : core::transition_table()) {
        if (rule.from == ProjectState::Approved) {
            EXPECT_EQ(rule.to, ProjectState::Archived);
        }
    }
    ASSERT_NE(core::find_rule(ProjectState::Approved, ProjectState::Archived), nullptr);
}

TEST(TransitionTableTest, EveryNonTerminalStateCanBeCancelled) {
    const ProjectState sources[] = {ProjectState::Requested, ProjectState::Assigned, ProjectState::Captured,
                                    ProjectState::Processing, ProjectState::QA, ProjectState::Delivered};
    for (const auto s : sources) {
        const auto* rule = core::find_rule(s, ProjectState::Archived);
        ASSERT_NE(rule, nullptr) << core::to_string(s);
        EXPECT_FALSE(rule->requires_approval);
    }
}

TEST(TransitionTableTest, CancellationRolesNarrowPerSource) {
    const auto* requested = core::find_rule(ProjectState::Requested, ProjectState::Archived);
    ASSERT_NE(requested, nullptr);
    EXPECT_EQ(requested->allowed_roles, (core::RoleSet{Role::Admin, Role::SalesLead, Role::CustomerOwner}));

    const auto* qa = core::find_rule(ProjectState::QA, ProjectState::Archived);
    ASSERT_NE(qa, nullptr);
    EXPECT_EQ(qa->allowed_roles, (core::RoleSet{Role::Admin, Role::Approver}));

    const auto* processing = core::find_rule(ProjectState::Processing, ProjectState::Archived);
    ASSERT_NE(processing, nullptr);
    EXPECT_FALSE(processing->allowed_roles.contains(Role::Technician));
}

TEST(TransitionTableTest, ApprovalGatesAreQaAndCustomerSignOff) {
    int approvals = 0;
    for (const auto& rule : core::transition_table()) {
        if (rule.requires_approval) {
            ++approvals;
        }
    }
    EXPECT_EQ(approvals, 2);
    EXPECT_TRUE(core::find_rule(ProjectState::QA, ProjectState::Delivered)->requires_approval);
    EXPECT_TRUE(core::find_rule(ProjectState::Delivered, ProjectState::Approved)->requires_approval);
}

TEST(TransitionTableTest, FindRuleRejectsMissingAndOutOfRange) {
    EXPECT_EQ(core::find_rule(ProjectState::Requested, ProjectState::Delivered), nullptr);
    EXPECT_EQ(core::find_rule(ProjectState::Captured, ProjectState::Assigned), nullptr);
    EXPECT_EQ(core::find_rule(static_cast<ProjectState>(12), ProjectState::Archived), nullptr);
    EXPECT_EQ(core::find_rule(ProjectState::Requested, static_cast<ProjectState>(12)), nullptr);
}

TEST(TransitionTableTest, FindRuleMatchesLinearScan) {
    for (const auto from : core::all_project_states) {
        for (const auto to : core::all_project_states) {
            const core::TransitionRule* scanned = nullptr;
            for (const auto& rule : core::transition_table()) {
                if (rule.from == from && rule.to == to) {
                    scanned = &rule;
                }
            }
            EXPECT_EQ(core::find_rule(from, to), scanned);
        }
    }
}

} // namespace

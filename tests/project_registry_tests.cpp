#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/project_registry.hpp"
#include "harness/lifecycle_harness.hpp"

namespace {

using core::ProjectState;
using core::Role;

core::TransitionRequest request(const std::string& project, Role role, ProjectState target,
                                const std::string& user = "U1") {
    core::TransitionRequest req;
    req.project_id = project;
    req.user_id = user;
    req.role = role;
    req.target = target;
    return req;
}

class ProjectRegistryTest : public ::testing::Test {
protected:
    test::ManualClock clock_;
    test::RecordingSink sink_;
};

TEST_F(ProjectRegistryTest, CreateProjectOnce) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    EXPECT_TRUE(registry.create_project("P1"));
    EXPECT_FALSE(registry.create_project("P1", ProjectState::QA));
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Requested);
    EXPECT_FALSE(registry.state_of("P2").has_value());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_THROW(registry.create_project(""), std::invalid_argument);
    EXPECT_THROW(registry.create_project("P3", static_cast<ProjectState>(40)), std::invalid_argument);
}

TEST_F(ProjectRegistryTest, CommittedTransitionAppendsEvent) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");

    auto req = request("P1", Role::SalesLead, ProjectState::Assigned, "sales-7");
    req.reason = "kickoff";
    req.metadata["channel"] = "phone";
    const auto out = registry.transition(req);

    ASSERT_TRUE(out.decision.valid);
    EXPECT_TRUE(out.committed);
    ASSERT_TRUE(out.event.has_value());
    EXPECT_EQ(out.event->from_state, ProjectState::Requested);
    EXPECT_EQ(out.event->to_state, ProjectState::Assigned);
    EXPECT_EQ(out.event->user_id, "sales-7");
    EXPECT_EQ(out.event->reason, std::optional<std::string>("kickoff"));
    EXPECT_EQ(out.event->metadata.at("channel"), "phone");

    ASSERT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(sink_.events[0], *out.event);
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Assigned);
    EXPECT_EQ(registry.counters().committed, 1u);
}

TEST_F(ProjectRegistryTest, RejectionLeavesStateAndSinkUntouched) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");

    const auto out = registry.transition(request("P1", Role::Technician, ProjectState::Assigned));
    EXPECT_FALSE(out.decision.valid);
    EXPECT_FALSE(out.committed);
    EXPECT_FALSE(out.event.has_value());
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Requested);
    EXPECT_EQ(sink_.append_calls, 0);
    EXPECT_EQ(registry.counters().rejected, 1u);
}

TEST_F(ProjectRegistryTest, NoopIsCommittedWithoutEventByDefault) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");

    const auto out = registry.transition(request("P1", Role::Technician, ProjectState::Requested));
    EXPECT_TRUE(out.decision.valid);
    EXPECT_TRUE(out.decision.is_noop());
    EXPECT_TRUE(out.committed);
    EXPECT_FALSE(out.event.has_value());
    EXPECT_EQ(sink_.append_calls, 0);
    EXPECT_TRUE(registry.history("P1").empty());
    EXPECT_EQ(registry.counters().noops, 1u);
    EXPECT_EQ(registry.counters().committed, 0u);
}

TEST_F(ProjectRegistryTest, NoopRecordedWhenConfigured) {
    auto cfg = core::default_lifecycle_config();
    cfg.record_noop_transitions = true;
    core::ProjectRegistry registry(cfg, &sink_, clock_);
    registry.create_project("P1");

    const auto out = registry.transition(request("P1", Role::Admin, ProjectState::Requested));
    EXPECT_TRUE(out.committed);
    ASSERT_TRUE(out.event.has_value());
    EXPECT_EQ(out.event->from_state, out.event->to_state);
    EXPECT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(registry.history("P1").size(), 1u);
}

TEST_F(ProjectRegistryTest, SinkFailureBlocksCommit) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");
    sink_.fail = true;

    const auto out = registry.transition(request("P1", Role::Admin, ProjectState::Assigned));
    EXPECT_TRUE(out.decision.valid);
    EXPECT_FALSE(out.committed);
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Requested);
    EXPECT_TRUE(registry.history("P1").empty());
    EXPECT_EQ(registry.counters().sink_failures, 1u);

    sink_.fail = false;
    EXPECT_TRUE(registry.transition(request("P1", Role::Admin, ProjectState::Assigned)).committed);
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Assigned);
}

TEST_F(ProjectRegistryTest, HistoryFollowsRetakeLoop) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");

    const std::vector<std::pair<Role, ProjectState>> steps{
        {Role::Admin, ProjectState::Assigned},      {Role::Technician, ProjectState::Captured},
        {Role::Technician, ProjectState::Processing}, {Role::Admin, ProjectState::QA},
        {Role::Approver, ProjectState::Captured},   {Role::Technician, ProjectState::Processing},
        {Role::Technician, ProjectState::QA},       {Role::Approver, ProjectState::Delivered},
        {Role::CustomerOwner, ProjectState::Approved},
    };
    for (const auto& [role, target] : steps) {
        ASSERT_TRUE(registry.transition(request("P1", role, target)).committed) << core::to_string(target);
    }

    const auto history = registry.history("P1");
    ASSERT_EQ(history.size(), steps.size());
    ProjectState expected_from = ProjectState::Requested;
    for (std::size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(history[i].from_state, expected_from);
        EXPECT_EQ(history[i].to_state, steps[i].second);
        if (i > 0) {
            EXPECT_GT(history[i].timestamp, history[i - 1].timestamp);
        }
        expected_from = history[i].to_state;
    }
    EXPECT_EQ(sink_.events, history);
    EXPECT_EQ(registry.valid_next_states("P1", Role::Admin), (core::StateSet{ProjectState::Archived}));
    EXPECT_TRUE(registry.valid_next_states("missing", Role::Admin).empty());
}

TEST_F(ProjectRegistryTest, MalformedRequestsThrow) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");
    EXPECT_THROW(registry.transition(request("nope", Role::Admin, ProjectState::Assigned)), std::invalid_argument);
    EXPECT_THROW(registry.transition(request("P1", Role::Admin, ProjectState::Assigned, "")),
                 std::invalid_argument);
}

TEST_F(ProjectRegistryTest, ConcurrentRequestsCommitOnce) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), &sink_, clock_);
    registry.create_project("P1");

    // All threads race Requested -> Assigned; the losers see a same-state request.
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&registry, i] {
            registry.transition(request("P1", Role::Admin, ProjectState::Assigned, "U" + std::to_string(i)));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    const auto c = registry.counters();
    EXPECT_EQ(c.committed, 1u);
    EXPECT_EQ(c.noops, 7u);
    EXPECT_EQ(sink_.events.size(), 1u);
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Assigned);
}

TEST_F(ProjectRegistryTest, WorksWithoutSink) {
    core::ProjectRegistry registry(core::default_lifecycle_config(), nullptr, clock_);
    registry.create_project("P1");
    EXPECT_TRUE(registry.transition(request("P1", Role::CustomerOwner, ProjectState::Archived)).committed);
    EXPECT_EQ(registry.state_of("P1"), ProjectState::Archived);
    EXPECT_EQ(registry.history("P1").size(), 1u);
}

} // namespace

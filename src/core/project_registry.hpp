#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/audit_event.hpp"
#include "core/audit_sink.hpp"
#include "core/enum_set.hpp"
#include "core/lifecycle_config.hpp"
#include "core/project_state.hpp"
#include "core/transition_validator.hpp"
#include "util/clock.hpp"

namespace core {

struct TransitionRequest {
    std::string project_id{};
    std::string user_id{};
    Role role{Role::Admin};
    ProjectState target{ProjectState::Requested};
    std::optional<std::string> reason{};
    AuditMetadata metadata{};
};

struct TransitionOutcome {
    TransitionDecision decision{};
    // True once the new state is visible through state_of(). A valid decision
    // can still end uncommitted when the audit sink refuses the event.
    bool committed{false};
    std::optional<AuditEvent> event{};
};

struct RegistryCounters {
    std::uint64_t committed{0};
    std::uint64_t rejected{0};
    std::uint64_t noops{0};
    std::uint64_t sink_failures{0};
};

// Reference commit layer around the validator. Holds each project's current
// state and history, and serializes read -> validate -> append -> write under
// one mutex so two concurrent requests can never both validate against a state
// that one of them is about to change. Audit events reach the sink in commit
// order.
//
// Role is taken as already resolved for the project; the registry does not
// check whether a technician is actually assigned to it.
class ProjectRegistry {
public:
    // `sink` and `clock` are borrowed and must outlive the registry. A null sink
    // keeps history in memory only.
    explicit ProjectRegistry(LifecycleConfig cfg = default_lifecycle_config(),
                             IAuditSink* sink = nullptr,
                             const util::SystemClock& clock = util::default_system_clock());

    ProjectRegistry(const ProjectRegistry&) = delete;
    ProjectRegistry& operator=(const ProjectRegistry&) = delete;

    // Returns false if the id is already registered. Throws std::invalid_argument
    // on an empty id or out-of-range state.
    bool create_project(const std::string& project_id, ProjectState initial = ProjectState::Requested);

    std::optional<ProjectState> state_of(const std::string& project_id) const;

    // Throws std::invalid_argument for an unknown project or empty user id.
    // Disallowed moves come back as an invalid decision.
    TransitionOutcome transition(const TransitionRequest& req);

    // Events committed for the project, oldest first. Empty for unknown ids.
    std::vector<AuditEvent> history(const std::string& project_id) const;

    // Empty for unknown ids.
    StateSet valid_next_states(const std::string& project_id, Role role) const;

    std::size_t size() const;
    RegistryCounters counters() const;

private:
    struct ProjectRecord {
        ProjectState state{ProjectState::Requested};
        std::vector<AuditEvent> history{};
    };

    LifecycleConfig cfg_;
    IAuditSink* sink_;
    AuditEventBuilder builder_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProjectRecord> projects_;
    RegistryCounters counters_{};
};

} // namespace core

#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>

#include "core/project_state.hpp"
#include "util/clock.hpp"
#include "util/time.hpp"

namespace core {

using AuditMetadata = std::map<std::string, std::string>;

// Record of one committed transition. Built once, then only copied: nothing in
// this codebase mutates an event after build().
struct AuditEvent {
    std::string project_id{};
    std::string user_id{};
    Role user_role{Role::Admin};
    ProjectState from_state{ProjectState::Requested};
    ProjectState to_state{ProjectState::Requested};
    std::optional<std::string> reason{};
    AuditMetadata metadata{};
    util::WallTime timestamp{};

    bool operator==(const AuditEvent&) const = default;
};

// Stamps audit events with the construction instant. Timestamps issued by one
// builder are strictly increasing even when the wall clock stalls or steps
// back, so events can be ordered by timestamp alone.
//
// The builder does not validate the transition; callers build only after
// validate_transition() returned a valid decision. Malformed input (empty ids,
// out-of-range enums) throws std::invalid_argument.
class AuditEventBuilder {
public:
    // `clock` must outlive the builder.
    explicit AuditEventBuilder(const util::SystemClock& clock = util::default_system_clock()) noexcept
        : clock_(clock) {}

    AuditEventBuilder(const AuditEventBuilder&) = delete;
    AuditEventBuilder& operator=(const AuditEventBuilder&) = delete;

    AuditEvent build(std::string project_id,
                     std::string user_id,
                     Role user_role,
                     ProjectState from_state,
                     ProjectState to_state,
                     std::optional<std::string> reason = std::nullopt,
                     AuditMetadata metadata = {});

private:
    util::WallTime next_timestamp() noexcept;

    const util::SystemClock& clock_;
    std::atomic<std::int64_t> last_ns_{std::numeric_limits<std::int64_t>::min()};
};

// Convenience over a process-wide builder on the system clock.
AuditEvent build_audit_event(std::string project_id,
                             std::string user_id,
                             Role user_role,
                             ProjectState from_state,
                             ProjectState to_state,
                             std::optional<std::string> reason = std::nullopt,
                             AuditMetadata metadata = {});

} // namespace core

#include "core/audit_event.hpp"

#include <stdexcept>
#include <utility>

namespace core {

util::WallTime AuditEventBuilder::next_timestamp() noexcept {
    const std::int64_t now = util::to_unix_ns(clock_.now());
    std::int64_t last = last_ns_.load(std::memory_order_relaxed);
    while (true) {
        const std::int64_t next = now > last ? now : last + 1;
        if (last_ns_.compare_exchange_weak(last, next, std::memory_order_acq_rel, std::memory_order_relaxed)) {
            return util::from_unix_ns(next);
        }
    }
}

AuditEvent AuditEventBuilder::build(std::string project_id,
                                    std::string user_id,
                                    Role user_role,
                                    ProjectState from_state,
                                    ProjectState to_state,
                                    std::optional<std::string> reason,
                                    AuditMetadata metadata) {
    if (project_id.empty()) {
        throw std::invalid_argument("audit event requires a project id");
    }
    if (user_id.empty()) {
        throw std::invalid_argument("audit event requires a user id");
    }
    if (!is_known_role(user_role)) {
        throw std::invalid_argument("audit event role out of range");
    }
    if (!is_known_state(from_state) || !is_known_state(to_state)) {
        throw std::invalid_argument("audit event state out of range");
    }

    AuditEvent ev{};
    ev.project_id = std::move(project_id);
    ev.user_id = std::move(user_id);
    ev.user_role = user_role;
    ev.from_state = from_state;
    ev.to_state = to_state;
    ev.reason = std::move(reason);
    ev.metadata = std::move(metadata);
    ev.timestamp = next_timestamp();
    return ev;
}

AuditEvent build_audit_event(std::string project_id,
                             std::string user_id,
                             Role user_role,
                             ProjectState from_state,
                             ProjectState to_state,
                             std::optional<std::string> reason,
                             AuditMetadata metadata) {
    static AuditEventBuilder builder;
    return builder.build(std::move(project_id), std::move(user_id), user_role, from_state, to_state,
                         std::move(reason), std::move(metadata));
}

} // namespace core

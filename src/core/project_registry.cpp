#include "core/project_registry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "core/lifecycle_queries.hpp"
#include "util/log.hpp"

namespace core {

ProjectRegistry::ProjectRegistry(LifecycleConfig cfg, IAuditSink* sink, const util::SystemClock& clock)
    : cfg_(cfg), sink_(sink), builder_(clock) {}

bool ProjectRegistry::create_project(const std::string& project_id, ProjectState initial) {
    if (project_id.empty()) {
        throw std::invalid_argument("ProjectRegistry project id must not be empty");
    }
    if (!is_known_state(initial)) {
        throw std::invalid_argument("ProjectRegistry initial state out of range");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = projects_.try_emplace(project_id);
    if (!inserted) {
        return false;
    }
    it->second.state = initial;
    LOG_DEBUG("project %s registered in state %s", project_id.c_str(), std::string(to_string(initial)).c_str());
    return true;
}

std::optional<ProjectState> ProjectRegistry::state_of(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

TransitionOutcome ProjectRegistry::transition(const TransitionRequest& req) {
    if (req.user_id.empty()) {
        throw std::invalid_argument("transition request requires a user id");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = projects_.find(req.project_id);
    if (it == projects_.end()) {
        throw std::invalid_argument("unknown project: " + req.project_id);
    }
    ProjectRecord& record = it->second;

    TransitionOutcome out{};
    out.decision = validate_transition(record.state, req.target, req.role);
    if (!out.decision.valid) {
        ++counters_.rejected;
        const auto lvl = cfg_.log_rejections ? util::LogLevel::Info : util::LogLevel::Debug;
        util::log(lvl, "project %s: %s (user=%s)", req.project_id.c_str(),
                  out.decision.error.value_or("rejected").c_str(), req.user_id.c_str());
        return out;
    }

    if (out.decision.is_noop()) {
        ++counters_.noops;
        if (!cfg_.record_noop_transitions) {
            out.committed = true;
            return out;
        }
    }

    AuditEvent event = builder_.build(req.project_id, req.user_id, req.role, record.state, req.target,
                                      req.reason, req.metadata);
    if (sink_ && !sink_->append(event)) {
        ++counters_.sink_failures;
        LOG_ERROR("project %s: audit sink refused %s -> %s, transition not committed", req.project_id.c_str(),
                  std::string(to_string(record.state)).c_str(), std::string(to_string(req.target)).c_str());
        return out;
    }

    if (!out.decision.is_noop()) {
        ++counters_.committed;
        LOG_INFO("project %s: %s -> %s by %s (%s)", req.project_id.c_str(),
                 std::string(to_string(record.state)).c_str(), std::string(to_string(req.target)).c_str(),
                 req.user_id.c_str(), std::string(to_string(req.role)).c_str());
    }
    record.state = req.target;
    record.history.push_back(event);
    out.committed = true;
    out.event = std::move(event);
    return out;
}

std::vector<AuditEvent> ProjectRegistry::history(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        return {};
    }
    return it->second.history;
}

StateSet ProjectRegistry::valid_next_states(const std::string& project_id, Role role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        return {};
    }
    return core::valid_next_states(it->second.state, role);
}

std::size_t ProjectRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.size();
}

RegistryCounters ProjectRegistry::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace core

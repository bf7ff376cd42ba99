#include "api/demo_lifecycle.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "persist/audit_journal_writer.hpp"
#include "util/log.hpp"

namespace api {

namespace {

using core::ProjectState;
using core::Role;

struct Step {
    Role role;
    ProjectState target;
    const char* user;
    const char* reason;
};

const std::vector<Step>& happy_script() {
    static const std::vector<Step> steps{
        {Role::SalesLead, ProjectState::Assigned, "sales-1", nullptr},
        {Role::Technician, ProjectState::Captured, "tech-1", nullptr},
        {Role::Technician, ProjectState::Processing, "tech-1", nullptr},
        {Role::Technician, ProjectState::QA, "tech-1", nullptr},
        {Role::Approver, ProjectState::Delivered, "qa-1", "meets capture standard"},
        {Role::CustomerOwner, ProjectState::Approved, "cust-1", "looks good"},
        {Role::Admin, ProjectState::Archived, "admin-1", nullptr},
    };
    return steps;
}

const std::vector<Step>& qa_retake_script() {
    static const std::vector<Step> steps{
        {Role::Admin, ProjectState::Assigned, "admin-1", nullptr},
        {Role::Technician, ProjectState::Captured, "tech-2", nullptr},
        {Role::Admin, ProjectState::Processing, "admin-1", nullptr},
        {Role::Technician, ProjectState::QA, "tech-2", nullptr},
        {Role::Approver, ProjectState::Captured, "qa-1", "blurry textures on north wall"},
        {Role::Technician, ProjectState::Processing, "tech-2", nullptr},
        {Role::Technician, ProjectState::QA, "tech-2", nullptr},
        {Role::Approver, ProjectState::Delivered, "qa-1", nullptr},
        {Role::CustomerOwner, ProjectState::Captured, "cust-2", "missing basement"},
        {Role::Technician, ProjectState::Processing, "tech-2", nullptr},
        {Role::Technician, ProjectState::QA, "tech-2", nullptr},
        {Role::Approver, ProjectState::Delivered, "qa-1", nullptr},
        {Role::CustomerOwner, ProjectState::Approved, "cust-2", nullptr},
    };
    return steps;
}

const std::vector<Step>& cancel_script() {
    static const std::vector<Step> steps{
        {Role::SalesLead, ProjectState::Assigned, "sales-1", nullptr},
        {Role::Technician, ProjectState::Archived, "tech-3", "site closed"}, // not allowed
        {Role::SalesLead, ProjectState::Archived, "sales-1", "customer withdrew"},
    };
    return steps;
}

} // namespace

DemoSummary run_demo(const DemoConfig& cfg) {
    persist::JournalCounters journal_counters;
    persist::AuditJournalConfig journal_cfg = persist::default_audit_journal_config();
    journal_cfg.output_dir = cfg.output_dir;
    persist::AuditJournalWriter writer(journal_cfg, journal_counters);

    core::LifecycleConfig lifecycle_cfg = core::default_lifecycle_config();
    lifecycle_cfg.log_rejections = true;
    core::ProjectRegistry registry(lifecycle_cfg, &writer);

    const std::vector<const std::vector<Step>*> scripts{&happy_script(), &qa_retake_script(), &cancel_script()};

    for (std::size_t i = 0; i < cfg.projects; ++i) {
        const std::string project_id = "P" + std::to_string(i + 1);
        registry.create_project(project_id);
        for (const auto& step : *scripts[i % scripts.size()]) {
            core::TransitionRequest req;
            req.project_id = project_id;
            req.user_id = step.user;
            req.role = step.role;
            req.target = step.target;
            if (step.reason) {
                req.reason = std::string(step.reason);
            }
            req.metadata["source"] = "demo";
            const auto outcome = registry.transition(req);
            if (outcome.decision.valid && !outcome.committed) {
                throw std::runtime_error("journal refused event for " + project_id);
            }
        }
    }

    DemoSummary summary;
    summary.projects = registry.size();
    summary.counters = registry.counters();
    summary.journal_file = writer.current_path();
    LOG_INFO("demo: projects=%zu committed=%llu rejected=%llu journal=%s", summary.projects,
             static_cast<unsigned long long>(summary.counters.committed),
             static_cast<unsigned long long>(summary.counters.rejected), summary.journal_file.string().c_str());
    return summary;
}

} // namespace api

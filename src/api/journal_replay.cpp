#include "api/journal_replay.hpp"

#include <string>
#include <utility>

#include "core/transition_validator.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace api {

const char* to_string(ViolationKind kind) noexcept {
    switch (kind) {
    case ViolationKind::IllegalTransition: return "illegal-transition";
    case ViolationKind::ChainBreak: return "chain-break";
    case ViolationKind::NonMonotonicTimestamp: return "non-monotonic-timestamp";
    case ViolationKind::NotInitialState: return "not-initial-state";
    case ViolationKind::CorruptRecord: return "corrupt-record";
    }
    return "unknown";
}

void JournalVerifier::add(ViolationKind kind, const core::AuditEvent& ev, const std::filesystem::path& file,
                          std::size_t offset, std::string detail) {
    if (!report_filter_.matches(ev)) {
        return;
    }
    violations_.push_back(ReplayViolation{kind, ev.project_id, file, offset, std::move(detail)});
}

void JournalVerifier::record_corrupt(const std::filesystem::path& file, std::size_t offset, std::string detail) {
    violations_.push_back(ReplayViolation{ViolationKind::CorruptRecord, {}, file, offset, std::move(detail)});
}

void JournalVerifier::observe(const core::AuditEvent& ev, const std::filesystem::path& file, std::size_t offset) {
    const bool reported = report_filter_.matches(ev);
    if (reported) {
        ++events_seen_;
    }

    auto it = projects_.find(ev.project_id);
    if (it == projects_.end()) {
        if (require_initial_requested_ && ev.from_state != core::ProjectState::Requested) {
            add(ViolationKind::NotInitialState, ev, file, offset,
                "history starts in " + std::string(core::to_string(ev.from_state)));
        }
    } else {
        if (it->second.state != ev.from_state) {
            add(ViolationKind::ChainBreak, ev, file, offset,
                "expected from_state " + std::string(core::to_string(it->second.state)) + ", recorded " +
                    std::string(core::to_string(ev.from_state)));
        }
        if (ev.timestamp <= it->second.last_ts) {
            add(ViolationKind::NonMonotonicTimestamp, ev, file, offset,
                "timestamp " + util::format_iso8601_utc(ev.timestamp) + " not after " +
                    util::format_iso8601_utc(it->second.last_ts));
        }
    }

    const auto decision = core::validate_transition(ev.from_state, ev.to_state, ev.user_role);
    if (!decision.valid) {
        add(ViolationKind::IllegalTransition, ev, file, offset, decision.error.value_or("not allowed"));
    }

    // Continue from the recorded target so one bad record is reported once.
    auto& tracked = projects_[ev.project_id];
    tracked.state = ev.to_state;
    tracked.last_ts = ev.timestamp;
    tracked.reported = tracked.reported || reported;
}

std::map<std::string, core::ProjectState> JournalVerifier::final_states() const {
    std::map<std::string, core::ProjectState> out;
    for (const auto& [id, tracked] : projects_) {
        if (tracked.reported) {
            out.emplace(id, tracked.state);
        }
    }
    return out;
}

ReplayReport replay_journal(const ReplayConfig& cfg) {
    persist::AuditJournalReaderOptions opts;
    opts.files = cfg.input_files;
    opts.directory = cfg.input_directory;

    ReplayReport report{};
    persist::AuditJournalReader reader(std::move(opts));
    if (!reader.open()) {
        return report;
    }

    JournalVerifier verifier(cfg.require_initial_requested, cfg.filter);
    core::AuditEvent ev{};
    while (true) {
        const auto res = reader.next(ev);
        if (res.status == persist::JournalReadStatus::EndOfStream) {
            break;
        }
        switch (res.status) {
        case persist::JournalReadStatus::Ok:
            verifier.observe(ev, res.file, res.offset);
            break;
        case persist::JournalReadStatus::Corrupt:
            verifier.record_corrupt(res.file, res.offset, persist::to_string(res.error));
            break;
        case persist::JournalReadStatus::Truncated:
        case persist::JournalReadStatus::EndOfStream:
            break;
        }
    }

    report.events = verifier.events_seen();
    report.files = reader.stats().files_opened;
    report.corrupt_records = reader.stats().records_corrupt;
    report.truncated_tails = reader.stats().truncated_tail;
    report.violations = verifier.violations();
    report.final_states = verifier.final_states();
    return report;
}

int run_replay(const ReplayConfig& cfg) {
    const auto report = replay_journal(cfg);
    if (report.files == 0) {
        LOG_ERROR("replay: no journal files found");
        return 1;
    }

    std::size_t logged = 0;
    for (const auto& v : report.violations) {
        if (logged++ >= cfg.max_violations_logged) {
            break;
        }
        LOG_WARN("replay: %s project=%s file=%s offset=%zu: %s", to_string(v.kind), v.project_id.c_str(),
                 v.file.filename().string().c_str(), v.offset, v.detail.c_str());
    }
    if (!cfg.quiet) {
        LOG_INFO("replay: files=%llu events=%llu projects=%zu corrupt=%llu truncated=%llu violations=%zu",
                 static_cast<unsigned long long>(report.files), static_cast<unsigned long long>(report.events),
                 report.final_states.size(), static_cast<unsigned long long>(report.corrupt_records),
                 static_cast<unsigned long long>(report.truncated_tails), report.violations.size());
    }
    return report.ok() ? 0 : 2;
}

} // namespace api

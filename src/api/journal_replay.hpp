#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/audit_event.hpp"
#include "core/project_state.hpp"
#include "persist/audit_journal_reader.hpp"

namespace api {

struct ReplayConfig {
    std::vector<std::filesystem::path> input_files{};
    std::filesystem::path input_directory{};
    // Selects what is reported. The whole journal is still verified.
    persist::AuditJournalFilter filter{};
    // Reject histories whose first event does not leave Requested.
    bool require_initial_requested{false};
    std::size_t max_violations_logged{20};
    bool quiet{false};
};

enum class ViolationKind {
    IllegalTransition,
    ChainBreak,
    NonMonotonicTimestamp,
    NotInitialState,
    CorruptRecord,
};

const char* to_string(ViolationKind kind) noexcept;

struct ReplayViolation {
    ViolationKind kind{ViolationKind::IllegalTransition};
    std::string project_id{};
    std::filesystem::path file{};
    std::size_t offset{0};
    std::string detail{};
};

// Re-checks a recorded history against the transition table: every event must
// be admissible for its recorded role, start where the previous event for the
// same project ended, and carry a later timestamp.
//
// Every event must be observed for the chain to hold. `report_filter` only
// narrows which events are counted and which violations are kept.
class JournalVerifier {
public:
    explicit JournalVerifier(bool require_initial_requested = false, persist::AuditJournalFilter report_filter = {})
        : require_initial_requested_(require_initial_requested), report_filter_(std::move(report_filter)) {}

    void observe(const core::AuditEvent& ev, const std::filesystem::path& file = {}, std::size_t offset = 0);
    void record_corrupt(const std::filesystem::path& file, std::size_t offset, std::string detail);

    const std::vector<ReplayViolation>& violations() const noexcept { return violations_; }
    std::uint64_t events_seen() const noexcept { return events_seen_; }
    // Last recorded state per project with at least one reported event, ordered
    // by project id.
    std::map<std::string, core::ProjectState> final_states() const;

private:
    struct Tracked {
        core::ProjectState state{core::ProjectState::Requested};
        util::WallTime last_ts{};
        bool reported{false};
    };

    void add(ViolationKind kind, const core::AuditEvent& ev, const std::filesystem::path& file,
             std::size_t offset, std::string detail);

    bool require_initial_requested_;
    persist::AuditJournalFilter report_filter_;
    std::unordered_map<std::string, Tracked> projects_;
    std::vector<ReplayViolation> violations_;
    std::uint64_t events_seen_{0};
};

struct ReplayReport {
    std::uint64_t events{0};
    std::uint64_t files{0};
    std::uint64_t corrupt_records{0};
    std::uint64_t truncated_tails{0};
    std::vector<ReplayViolation> violations{};
    std::map<std::string, core::ProjectState> final_states{};

    bool ok() const noexcept { return violations.empty(); }
};

ReplayReport replay_journal(const ReplayConfig& cfg);

// Runs replay_journal and logs a summary. Returns 0 when the history is
// consistent, 2 when violations were found, 1 when nothing could be read.
int run_replay(const ReplayConfig& cfg);

} // namespace api

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/audit_event.hpp"
#include "core/project_state.hpp"
#include "persist/audit_journal_format.hpp"
#include "util/time.hpp"

namespace persist {

// Mirrors the portal's audit-log query: every set field must match.
struct AuditJournalFilter {
    std::optional<std::string> project_id{};
    std::optional<std::string> user_id{};
    std::optional<core::Role> role{};
    // Matches when the event leaves or enters this state.
    std::optional<core::ProjectState> state{};
    // Inclusive bounds on the event timestamp.
    std::optional<util::WallTime> from_time{};
    std::optional<util::WallTime> to_time{};

    bool matches(const core::AuditEvent& ev) const noexcept;
};

struct AuditJournalReaderOptions {
    std::vector<std::filesystem::path> files{};
    std::filesystem::path directory{};
    AuditJournalFilter filter{};
};

struct AuditJournalReaderStats {
    std::uint64_t records_ok{0};
    std::uint64_t records_corrupt{0};
    std::uint64_t filtered_out{0};
    std::uint64_t files_opened{0};
    std::uint64_t bytes_read{0};
    std::uint64_t truncated_tail{0};
    std::uint64_t io_errors{0};
};

enum class JournalReadStatus {
    Ok = 0,
    EndOfStream,
    Corrupt,
    Truncated,
};

struct JournalReadResult {
    JournalReadStatus status{JournalReadStatus::EndOfStream};
    DecodeError error{DecodeError::Ok};
    std::filesystem::path file{};
    std::size_t offset{0};
};

// Journal files under `dir` (non-recursive), in creation order.
std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir);

// Sequential reader over one or more journal files. Files that cannot be read
// are counted and skipped. A corrupt record is reported once and skipped; a
// truncated tail ends the current file.
class AuditJournalReader {
public:
    explicit AuditJournalReader(AuditJournalReaderOptions opts, JournalCounters* counters = nullptr);

    // Collects files (explicit list or directory scan). False when there is
    // nothing to read.
    bool open();

    JournalReadResult next(core::AuditEvent& out);

    // Every matching event, skipping corrupt records.
    std::vector<core::AuditEvent> read_all();

    const AuditJournalReaderStats& stats() const noexcept { return stats_; }
    const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    bool open_current_file();
    void close_file() noexcept;

    AuditJournalReaderOptions opts_;
    JournalCounters* counters_;
    AuditJournalReaderStats stats_;
    std::vector<std::filesystem::path> files_;
    std::vector<std::byte> buffer_;
    std::size_t offset_{0};
    std::size_t file_index_{0};
    bool have_current_{false};
};

} // namespace persist

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/audit_event.hpp"
#include "core/audit_sink.hpp"
#include "persist/audit_journal_format.hpp"
#include "persist/file_sink.hpp"
#include "util/clock.hpp"

namespace persist {

struct AuditJournalConfig {
    std::filesystem::path output_dir{"./audit_journal"};
    std::size_t rotate_max_bytes{64 * 1024 * 1024}; // 64MB
    std::chrono::seconds rotate_interval{std::chrono::hours(24)};
    bool sync_on_append{false};
    std::chrono::milliseconds initial_recovery_backoff{1000};
    std::chrono::milliseconds max_recovery_backoff{30000};
};

[[nodiscard]] inline AuditJournalConfig default_audit_journal_config() {
    return AuditJournalConfig{};
}

// Synchronous append-only journal of audit events, one framed record per
// event. Files rotate on size and age. On an I/O failure the writer enters a
// degraded mode in which append() refuses events (so the registry does not
// commit them) until a new file can be opened; retries back off exponentially.
//
// Not thread-safe; the owning ProjectRegistry serializes append() calls.
class AuditJournalWriter final : public core::IAuditSink {
public:
    // Throws std::invalid_argument on an empty output_dir, zero rotate_max_bytes
    // or a non-positive rotate_interval. `clock` must outlive the writer.
    AuditJournalWriter(AuditJournalConfig cfg,
                       JournalCounters& counters,
                       std::unique_ptr<IFileSink> sink = nullptr,
                       const util::SystemClock& clock = util::default_system_clock());
    ~AuditJournalWriter() override;

    AuditJournalWriter(const AuditJournalWriter&) = delete;
    AuditJournalWriter& operator=(const AuditJournalWriter&) = delete;

    bool append(const core::AuditEvent& event) override;
    void close() noexcept;

    bool degraded() const noexcept { return degraded_; }
    const std::filesystem::path& current_path() const noexcept { return current_path_; }
    std::uint64_t files_opened() const noexcept { return file_seq_; }

private:
    using time_point = util::SystemClock::time_point;

    bool ensure_file_ready(std::size_t next_record_size, time_point now);
    bool open_new_file(time_point now);
    bool writev_fully(const struct iovec* iov, int iovcnt);
    void enter_degraded(const char* reason, time_point now);
    bool maybe_recover(time_point now);
    bool should_log(time_point now) noexcept;

    AuditJournalConfig cfg_;
    JournalCounters& counters_;
    std::unique_ptr<IFileSink> sink_;
    const util::SystemClock& clock_;

    std::vector<std::byte> scratch_;
    std::filesystem::path current_path_;
    std::uint64_t file_seq_{0};
    time_point file_opened_at_{};
    time_point last_error_log_{};

    bool degraded_{false};
    time_point next_recovery_attempt_{};
    std::chrono::milliseconds recovery_backoff_{0};
};

// audit_<YYYYmmdd_HHMMSS>_seq<NNNNNN>.bin, UTC. Lexicographic order of these
// names is creation order.
std::string journal_filename(std::chrono::system_clock::time_point tp, std::uint64_t seq);

} // namespace persist

#include "persist/audit_journal_writer.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "util/log.hpp"

namespace persist {

namespace {

constexpr std::chrono::milliseconds kLogInterval{1000};

} // namespace

std::string journal_filename(std::chrono::system_clock::time_point tp, std::uint64_t seq) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << journal_filename_prefix();
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_seq" << std::setw(6) << std::setfill('0') << seq
        << journal_filename_extension();
    return oss.str();
}

AuditJournalWriter::AuditJournalWriter(AuditJournalConfig cfg,
                                       JournalCounters& counters,
                                       std::unique_ptr<IFileSink> sink,
                                       const util::SystemClock& clock)
    : cfg_(std::move(cfg)),
      counters_(counters),
      sink_(std::move(sink)),
      clock_(clock),
      recovery_backoff_(cfg_.initial_recovery_backoff) {
    if (cfg_.output_dir.empty()) {
        throw std::invalid_argument("AuditJournalWriter output_dir must not be empty");
    }
    if (cfg_.rotate_max_bytes == 0) {
        throw std::invalid_argument("AuditJournalWriter rotate_max_bytes must be > 0");
    }
    if (cfg_.rotate_interval.count() <= 0) {
        throw std::invalid_argument("AuditJournalWriter rotate_interval must be positive");
    }
    if (!sink_) {
        sink_ = std::make_unique<PosixFileSink>();
    }
}

AuditJournalWriter::~AuditJournalWriter() { close(); }

void AuditJournalWriter::close() noexcept {
    if (sink_ && sink_->is_open()) {
        sink_->close();
    }
}

bool AuditJournalWriter::should_log(time_point now) noexcept {
    if (last_error_log_.time_since_epoch().count() == 0 || now - last_error_log_ >= kLogInterval) {
        last_error_log_ = now;
        return true;
    }
    return false;
}

bool AuditJournalWriter::append(const core::AuditEvent& event) {
    const auto now = clock_.now();
    if (degraded_ && !maybe_recover(now)) {
        counters_.writer_drops.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    scratch_.clear();
    if (!encode_state_change_record(event, scratch_)) {
        counters_.encode_failures.fetch_add(1, std::memory_order_relaxed);
        if (should_log(now)) {
            LOG_ERROR("AuditJournalWriter: event for project %s exceeds journal limits", event.project_id.c_str());
        }
        return false;
    }

    if (!ensure_file_ready(scratch_.size(), now)) {
        counters_.writer_drops.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    struct iovec iov{scratch_.data(), scratch_.size()};
    if (!writev_fully(&iov, 1)) {
        enter_degraded("write failure", now);
        counters_.writer_drops.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    if (cfg_.sync_on_append) {
        const auto res = sink_->sync();
        if (!res.ok) {
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            if (should_log(now)) {
                LOG_ERROR("AuditJournalWriter: sync(%s) failed err=%d", current_path_.string().c_str(),
                          res.error_code);
            }
            enter_degraded("sync failure", now);
            counters_.writer_drops.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }
    counters_.records_written.fetch_add(1, std::memory_order_relaxed);
    counters_.bytes_written.fetch_add(scratch_.size(), std::memory_order_relaxed);
    return true;
}

bool AuditJournalWriter::open_new_file(time_point now) {
    std::error_code ec;
    std::filesystem::create_directories(cfg_.output_dir, ec);
    if (ec) {
        if (should_log(now)) {
            LOG_ERROR("AuditJournalWriter: failed to create dir %s: %s", cfg_.output_dir.string().c_str(),
                      ec.message().c_str());
        }
        return false;
    }
    current_path_ = cfg_.output_dir / journal_filename(now, file_seq_++);
    const auto res = sink_->open(current_path_.string());
    if (!res.ok) {
        if (should_log(now)) {
            LOG_ERROR("AuditJournalWriter: open(%s) failed: %d", current_path_.string().c_str(), res.error_code);
        }
        return false;
    }
    file_opened_at_ = now;
    LOG_DEBUG("AuditJournalWriter: writing %s", current_path_.string().c_str());
    return true;
}

bool AuditJournalWriter::ensure_file_ready(std::size_t next_record_size, time_point now) {
    if (!sink_->is_open()) {
        if (!open_new_file(now)) {
            enter_degraded("open failed", now);
            return false;
        }
        return true;
    }
    bool need_rotate = now - file_opened_at_ >= cfg_.rotate_interval;
    if (!need_rotate) {
        const std::uint64_t projected = sink_->current_size() + next_record_size;
        // An oversized record still goes into a fresh file rather than being refused.
        need_rotate = sink_->current_size() > 0 && projected > cfg_.rotate_max_bytes;
    }
    if (need_rotate) {
        sink_->close();
        counters_.rotations.fetch_add(1, std::memory_order_relaxed);
        if (!open_new_file(now)) {
            enter_degraded("rotate/open failed", now);
            return false;
        }
    }
    return true;
}

bool AuditJournalWriter::writev_fully(const struct iovec* iov, int iovcnt) {
    std::array<struct iovec, 4> tmp{};
    std::vector<struct iovec> dynamic;
    struct iovec* cur = nullptr;
    int cur_cnt = iovcnt;

    if (iovcnt <= static_cast<int>(tmp.size())) {
        std::copy(iov, iov + iovcnt, tmp.begin());
        cur = tmp.data();
    } else {
        dynamic.assign(iov, iov + iovcnt);
        cur = dynamic.data();
    }

    while (cur_cnt > 0) {
        std::size_t bytes_written = 0;
        const auto res = sink_->writev(cur, cur_cnt, bytes_written);
        if (!res.ok) {
            if (res.error_code == EINTR) {
                continue;
            }
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            if (should_log(clock_.now())) {
                LOG_ERROR("AuditJournalWriter: writev failed err=%d", res.error_code);
            }
            return false;
        }
        if (bytes_written == 0) {
            counters_.io_errors.fetch_add(1, std::memory_order_relaxed);
            if (should_log(clock_.now())) {
                LOG_ERROR("AuditJournalWriter: writev wrote 0 bytes");
            }
            return false;
        }

        std::size_t remaining = bytes_written;
        while (remaining > 0 && cur_cnt > 0) {
            if (remaining < cur[0].iov_len) {
                cur[0].iov_base = static_cast<std::byte*>(cur[0].iov_base) + remaining;
                cur[0].iov_len -= remaining;
                remaining = 0;
            } else {
                remaining -= cur[0].iov_len;
                ++cur;
                --cur_cnt;
            }
        }
    }
    return true;
}

void AuditJournalWriter::enter_degraded(const char* reason, time_point now) {
    if (degraded_) {
        return;
    }
    degraded_ = true;
    recovery_backoff_ = cfg_.initial_recovery_backoff;
    next_recovery_attempt_ = now + recovery_backoff_;
    LOG_ERROR("AuditJournalWriter entering degraded mode: %s", reason);
    if (sink_->is_open()) {
        sink_->close();
    }
}

bool AuditJournalWriter::maybe_recover(time_point now) {
    if (!degraded_) {
        return true;
    }
    if (now < next_recovery_attempt_) {
        return false;
    }
    if (open_new_file(now)) {
        degraded_ = false;
        LOG_INFO("AuditJournalWriter recovered from degraded mode, now writing %s", current_path_.string().c_str());
        return true;
    }
    recovery_backoff_ = std::min(recovery_backoff_ * 2, cfg_.max_recovery_backoff);
    next_recovery_attempt_ = now + recovery_backoff_;
    return false;
}

} // namespace persist

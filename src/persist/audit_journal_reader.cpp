#include "persist/audit_journal_reader.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <span>
#include <system_error>
#include <utility>

#include "util/log.hpp"

namespace persist {

bool AuditJournalFilter::matches(const core::AuditEvent& ev) const noexcept {
    if (project_id && ev.project_id != *project_id) {
        return false;
    }
    if (user_id && ev.user_id != *user_id) {
        return false;
    }
    if (role && ev.user_role != *role) {
        return false;
    }
    if (state && ev.from_state != *state && ev.to_state != *state) {
        return false;
    }
    if (from_time && ev.timestamp < *from_time) {
        return false;
    }
    if (to_time && ev.timestamp > *to_time) {
        return false;
    }
    return true;
}

std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        LOG_WARN("scan_journal_files: cannot list %s: %s", dir.string().c_str(), ec.message().c_str());
        return out;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        const auto prefix = journal_filename_prefix();
        const auto ext = journal_filename_extension();
        if (name.size() > prefix.size() + ext.size() && name.compare(0, prefix.size(), prefix) == 0 &&
            name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return out;
}

AuditJournalReader::AuditJournalReader(AuditJournalReaderOptions opts, JournalCounters* counters)
    : opts_(std::move(opts)), counters_(counters) {}

bool AuditJournalReader::open() {
    files_.clear();
    if (!opts_.files.empty()) {
        files_ = opts_.files;
    } else if (!opts_.directory.empty()) {
        files_ = scan_journal_files(opts_.directory);
    }
    file_index_ = 0;
    close_file();
    return !files_.empty();
}

bool AuditJournalReader::open_current_file() {
    close_file();
    while (file_index_ < files_.size()) {
        const auto& path = files_[file_index_];
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec || size > static_cast<std::uintmax_t>(std::numeric_limits<std::size_t>::max())) {
            ++stats_.io_errors;
            LOG_WARN("AuditJournalReader: skipping %s: cannot stat", path.string().c_str());
            ++file_index_;
            continue;
        }
        buffer_.resize(static_cast<std::size_t>(size));
        if (size > 0) {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open() ||
                !in.read(reinterpret_cast<char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()))) {
                ++stats_.io_errors;
                LOG_WARN("AuditJournalReader: skipping %s: read failed", path.string().c_str());
                ++file_index_;
                close_file();
                continue;
            }
        }
        offset_ = 0;
        have_current_ = true;
        ++stats_.files_opened;
        stats_.bytes_read += buffer_.size();
        return true;
    }
    return false;
}

void AuditJournalReader::close_file() noexcept {
    buffer_.clear();
    offset_ = 0;
    have_current_ = false;
}

JournalReadResult AuditJournalReader::next(core::AuditEvent& out) {
    while (true) {
        if (!have_current_) {
            if (!open_current_file()) {
                return {JournalReadStatus::EndOfStream, DecodeError::Ok, {}, 0};
            }
        }
        if (offset_ >= buffer_.size()) {
            ++file_index_;
            close_file();
            continue;
        }

        const std::size_t record_offset = offset_;
        std::size_t consumed = 0;
        const auto err = decode_record(
            std::span<const std::byte>(buffer_.data() + offset_, buffer_.size() - offset_), out, consumed, counters_);
        offset_ += consumed;

        if (is_graceful_eof(err)) {
            ++stats_.truncated_tail;
            JournalReadResult res{JournalReadStatus::Truncated, err, files_[file_index_], record_offset};
            ++file_index_;
            close_file();
            return res;
        }
        if (err != DecodeError::Ok) {
            ++stats_.records_corrupt;
            return {JournalReadStatus::Corrupt, err, files_[file_index_], record_offset};
        }
        if (!opts_.filter.matches(out)) {
            ++stats_.filtered_out;
            continue;
        }
        ++stats_.records_ok;
        return {JournalReadStatus::Ok, DecodeError::Ok, files_[file_index_], record_offset};
    }
}

std::vector<core::AuditEvent> AuditJournalReader::read_all() {
    std::vector<core::AuditEvent> events;
    core::AuditEvent ev{};
    while (true) {
        const auto res = next(ev);
        if (res.status == JournalReadStatus::EndOfStream) {
            break;
        }
        if (res.status == JournalReadStatus::Ok) {
            events.push_back(ev);
        }
    }
    return events;
}

} // namespace persist

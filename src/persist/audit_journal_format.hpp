#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "core/audit_event.hpp"

namespace persist {

// Audit journal on-disk contract (little endian):
//   record  = [u32 type][u32 payload_len][payload][u32 crc32c(header + payload)]
//   payload = u16 schema | u8 role | u8 from | u8 to | u8 flags | u16 reserved |
//             i64 timestamp_ns | str project_id | str user_id | [str reason] |
//             u16 metadata_count | (str key, str value) * metadata_count
//   str     = u16 length | bytes
// flags bit0 marks the presence of a reason.

enum class JournalRecordType : std::uint32_t {
    Reserved = 0,
    StateChange = 1,
};

inline constexpr std::uint16_t journal_schema_version_v1 = 1;

inline constexpr std::size_t header_size = sizeof(std::uint32_t) * 2; // type + payload_len
inline constexpr std::size_t trailer_size = sizeof(std::uint32_t);    // crc32c
inline constexpr std::size_t fixed_payload_v1_size = 16;
inline constexpr std::size_t max_payload_size = 1u << 20;
inline constexpr std::size_t max_string_size = 0xFFFFu;
inline constexpr std::size_t max_metadata_entries = 0xFFFFu;

inline constexpr std::uint8_t flag_has_reason = 0x01u;

inline constexpr std::size_t record_size_from_payload(std::size_t payload_len) noexcept {
    return header_size + payload_len + trailer_size;
}

struct JournalCounters {
    std::atomic<std::uint64_t> records_written{0};
    std::atomic<std::uint64_t> bytes_written{0};
    std::atomic<std::uint64_t> encode_failures{0};
    std::atomic<std::uint64_t> io_errors{0};
    std::atomic<std::uint64_t> writer_drops{0};
    std::atomic<std::uint64_t> rotations{0};

    std::atomic<std::uint64_t> parse_errors_version_mismatch{0};
    std::atomic<std::uint64_t> parse_errors_invalid_length{0};
    std::atomic<std::uint64_t> parse_errors_truncated{0};
    std::atomic<std::uint64_t> parse_errors_crc{0};
    std::atomic<std::uint64_t> parse_errors_invalid_type{0};
    std::atomic<std::uint64_t> parse_errors_invalid_payload{0};
};

enum class DecodeError {
    Ok = 0,
    TruncatedAtEnd,
    InvalidType,
    VersionMismatch,
    InvalidLength,
    InvalidCrc,
    InvalidPayload,
};

const char* to_string(DecodeError err) noexcept;

// Size of the payload for `ev`, or 0 when the event cannot be represented
// (a string over max_string_size, too many metadata entries, or a payload over
// max_payload_size).
std::size_t encoded_payload_size(const core::AuditEvent& ev) noexcept;

// Appends one framed record to `out`. Returns false, leaving `out` untouched,
// when encoded_payload_size() is 0.
bool encode_state_change_record(const core::AuditEvent& ev, std::vector<std::byte>& out);

// Decodes the record at the start of `data`. `consumed` is always set to how
// far a reader must advance to get past this record: the framed size when the
// frame is intact (even if its content is rejected), or the rest of `data`
// when the frame is truncated or its length field is out of range.
DecodeError decode_record(std::span<const std::byte> data,
                          core::AuditEvent& out,
                          std::size_t& consumed,
                          JournalCounters* counters = nullptr);

inline bool is_graceful_eof(DecodeError err) noexcept {
    return err == DecodeError::TruncatedAtEnd;
}

inline std::string_view journal_filename_prefix() noexcept { return "audit_"; }
inline std::string_view journal_filename_extension() noexcept { return ".bin"; }

} // namespace persist

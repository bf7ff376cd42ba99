#include "persist/audit_journal_format.hpp"

#include <string>
#include <utility>

#include "persist/endianness.hpp"
#include "util/crc32c.hpp"
#include "util/time.hpp"

namespace persist {

namespace {

std::uint32_t compute_record_crc(const std::byte* header, const std::byte* payload, std::size_t payload_len) noexcept {
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, header, header_size);
    crc = util::Crc32c::update(crc, payload, payload_len);
    return util::Crc32c::finalize(crc);
}

std::size_t string_field_size(const std::string& s) noexcept {
    return sizeof(std::uint16_t) + s.size();
}

std::byte* put_string(const std::string& s, std::byte* p) noexcept {
    store_le16(static_cast<std::uint16_t>(s.size()), p);
    p += 2;
    for (const char c : s) {
        *p++ = static_cast<std::byte>(static_cast<unsigned char>(c));
    }
    return p;
}

// Bounds-checked cursor over a payload.
class PayloadCursor {
public:
    explicit PayloadCursor(std::span<const std::byte> data) noexcept : data_(data) {}

    bool u8(std::uint8_t& out) noexcept {
        if (remaining() < 1) {
            return false;
        }
        out = static_cast<std::uint8_t>(data_[pos_]);
        pos_ += 1;
        return true;
    }

    bool u16(std::uint16_t& out) noexcept {
        if (remaining() < 2) {
            return false;
        }
        out = load_le16(data_.data() + pos_);
        pos_ += 2;
        return true;
    }

    bool i64(std::int64_t& out) noexcept {
        if (remaining() < 8) {
            return false;
        }
        out = static_cast<std::int64_t>(load_le64(data_.data() + pos_));
        pos_ += 8;
        return true;
    }

    bool str(std::string& out) {
        std::uint16_t len = 0;
        if (!u16(len) || remaining() < len) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_{0};
};

void bump(std::atomic<std::uint64_t> JournalCounters::*field, JournalCounters* counters) noexcept {
    if (counters) {
        (counters->*field).fetch_add(1, std::memory_order_relaxed);
    }
}

bool decode_payload_v1(std::span<const std::byte> payload, core::AuditEvent& out) {
    PayloadCursor cur(payload);
    std::uint16_t schema = 0;
    std::uint8_t role = 0;
    std::uint8_t from = 0;
    std::uint8_t to = 0;
    std::uint8_t flags = 0;
    std::uint16_t reserved = 0;
    std::int64_t ts_ns = 0;
    if (!cur.u16(schema) || !cur.u8(role) || !cur.u8(from) || !cur.u8(to) || !cur.u8(flags) ||
        !cur.u16(reserved) || !cur.i64(ts_ns)) {
        return false;
    }
    const auto r = static_cast<core::Role>(role);
    const auto f = static_cast<core::ProjectState>(from);
    const auto t = static_cast<core::ProjectState>(to);
    if (!core::is_known_role(r) || !core::is_known_state(f) || !core::is_known_state(t)) {
        return false;
    }

    core::AuditEvent ev{};
    ev.user_role = r;
    ev.from_state = f;
    ev.to_state = t;
    ev.timestamp = util::from_unix_ns(ts_ns);
    if (!cur.str(ev.project_id) || !cur.str(ev.user_id)) {
        return false;
    }
    if ((flags & flag_has_reason) != 0) {
        std::string reason;
        if (!cur.str(reason)) {
            return false;
        }
        ev.reason = std::move(reason);
    }
    std::uint16_t count = 0;
    if (!cur.u16(count)) {
        return false;
    }
    for (std::uint16_t i = 0; i < count; ++i) {
        std::string key;
        std::string value;
        if (!cur.str(key) || !cur.str(value)) {
            return false;
        }
        ev.metadata.insert_or_assign(std::move(key), std::move(value));
    }
    if (cur.remaining() != 0) {
        return false;
    }
    out = std::move(ev);
    return true;
}

} // namespace

const char* to_string(DecodeError err) noexcept {
    switch (err) {
    case DecodeError::Ok: return "ok";
    case DecodeError::TruncatedAtEnd: return "truncated";
    case DecodeError::InvalidType: return "invalid record type";
    case DecodeError::VersionMismatch: return "unsupported schema version";
    case DecodeError::InvalidLength: return "invalid length";
    case DecodeError::InvalidCrc: return "crc mismatch";
    case DecodeError::InvalidPayload: return "invalid payload";
    }
    return "unknown";
}

std::size_t encoded_payload_size(const core::AuditEvent& ev) noexcept {
    if (ev.project_id.size() > max_string_size || ev.user_id.size() > max_string_size) {
        return 0;
    }
    if (ev.metadata.size() > max_metadata_entries) {
        return 0;
    }
    std::size_t size = fixed_payload_v1_size;
    size += string_field_size(ev.project_id);
    size += string_field_size(ev.user_id);
    if (ev.reason) {
        if (ev.reason->size() > max_string_size) {
            return 0;
        }
        size += string_field_size(*ev.reason);
    }
    size += sizeof(std::uint16_t);
    for (const auto& [key, value] : ev.metadata) {
        if (key.size() > max_string_size || value.size() > max_string_size) {
            return 0;
        }
        size += string_field_size(key) + string_field_size(value);
    }
    return size > max_payload_size ? 0 : size;
}

bool encode_state_change_record(const core::AuditEvent& ev, std::vector<std::byte>& out) {
    const std::size_t payload_len = encoded_payload_size(ev);
    if (payload_len == 0) {
        return false;
    }
    const std::size_t base_offset = out.size();
    out.resize(base_offset + record_size_from_payload(payload_len));
    std::byte* base = out.data() + base_offset;

    store_le32(static_cast<std::uint32_t>(JournalRecordType::StateChange), base);
    store_le32(static_cast<std::uint32_t>(payload_len), base + 4);

    std::byte* p = base + header_size;
    store_le16(journal_schema_version_v1, p); p += 2;
    p[0] = static_cast<std::byte>(ev.user_role);
    p[1] = static_cast<std::byte>(ev.from_state);
    p[2] = static_cast<std::byte>(ev.to_state);
    p[3] = static_cast<std::byte>(ev.reason ? flag_has_reason : 0u);
    p += 4;
    store_le16(0, p); p += 2; // reserved
    store_le64(static_cast<std::uint64_t>(util::to_unix_ns(ev.timestamp)), p); p += 8;
    p = put_string(ev.project_id, p);
    p = put_string(ev.user_id, p);
    if (ev.reason) {
        p = put_string(*ev.reason, p);
    }
    store_le16(static_cast<std::uint16_t>(ev.metadata.size()), p); p += 2;
    for (const auto& [key, value] : ev.metadata) {
        p = put_string(key, p);
        p = put_string(value, p);
    }

    const auto crc = compute_record_crc(base, base + header_size, payload_len);
    store_le32(crc, base + header_size + payload_len);
    return true;
}

DecodeError decode_record(std::span<const std::byte> data,
                          core::AuditEvent& out,
                          std::size_t& consumed,
                          JournalCounters* counters) {
    consumed = data.size();
    if (data.size() < header_size) {
        bump(&JournalCounters::parse_errors_truncated, counters);
        return DecodeError::TruncatedAtEnd;
    }
    const std::byte* header = data.data();
    const std::uint32_t type_raw = load_le32(header);
    const std::uint32_t payload_len = load_le32(header + 4);
    if (payload_len > max_payload_size) {
        // The length itself is untrustworthy; nothing after it can be framed.
        bump(&JournalCounters::parse_errors_invalid_length, counters);
        return DecodeError::InvalidLength;
    }
    const std::size_t total = record_size_from_payload(payload_len);
    if (data.size() < total) {
        bump(&JournalCounters::parse_errors_truncated, counters);
        return DecodeError::TruncatedAtEnd;
    }
    consumed = total;

    if (static_cast<JournalRecordType>(type_raw) != JournalRecordType::StateChange) {
        bump(&JournalCounters::parse_errors_invalid_type, counters);
        return DecodeError::InvalidType;
    }

    const std::byte* payload = header + header_size;
    const std::uint32_t crc_expected = load_le32(payload + payload_len);
    if (crc_expected != compute_record_crc(header, payload, payload_len)) {
        bump(&JournalCounters::parse_errors_crc, counters);
        return DecodeError::InvalidCrc;
    }

    if (payload_len < fixed_payload_v1_size) {
        bump(&JournalCounters::parse_errors_invalid_length, counters);
        return DecodeError::InvalidLength;
    }
    const auto schema = load_le16(payload);
    if (schema > journal_schema_version_v1) {
        bump(&JournalCounters::parse_errors_version_mismatch, counters);
        return DecodeError::VersionMismatch;
    }
    if (schema != journal_schema_version_v1 ||
        !decode_payload_v1(std::span<const std::byte>(payload, payload_len), out)) {
        bump(&JournalCounters::parse_errors_invalid_payload, counters);
        return DecodeError::InvalidPayload;
    }
    return DecodeError::Ok;
}

} // namespace persist

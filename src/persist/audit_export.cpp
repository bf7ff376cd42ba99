#include "persist/audit_export.hpp"

#include <cstdio>

#include "util/time.hpp"

namespace persist {

std::optional<ExportFormat> parse_export_format(std::string_view text) noexcept {
    if (text == "csv") {
        return ExportFormat::Csv;
    }
    if (text == "json" || text == "jsonl") {
        return ExportFormat::JsonLines;
    }
    return std::nullopt;
}

std::string csv_escape(std::string_view field) {
    const bool needs_quotes = field.find_first_of(",\"\r\n") != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (const char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buf;
            } else {
                out.push_back(c);
            }
        }
    }
    return out;
}

void write_csv(std::ostream& os, std::span<const core::AuditEvent> events) {
    os << "timestamp,project_id,user_id,user_role,from_state,to_state,reason,metadata\n";
    for (const auto& ev : events) {
        std::string meta;
        for (const auto& [key, value] : ev.metadata) {
            if (!meta.empty()) {
                meta.push_back(';');
            }
            meta += key;
            meta.push_back('=');
            meta += value;
        }
        os << util::format_iso8601_utc(ev.timestamp) << ','
           << csv_escape(ev.project_id) << ','
           << csv_escape(ev.user_id) << ','
           << core::to_string(ev.user_role) << ','
           << core::to_string(ev.from_state) << ','
           << core::to_string(ev.to_state) << ','
           << csv_escape(ev.reason.value_or("")) << ','
           << csv_escape(meta) << '\n';
    }
}

void write_json_lines(std::ostream& os, std::span<const core::AuditEvent> events) {
    for (const auto& ev : events) {
        os << "{\"project_id\":\"" << json_escape(ev.project_id) << '"'
           << ",\"user_id\":\"" << json_escape(ev.user_id) << '"'
           << ",\"user_role\":\"" << core::to_string(ev.user_role) << '"'
           << ",\"from_state\":\"" << core::to_string(ev.from_state) << '"'
           << ",\"to_state\":\"" << core::to_string(ev.to_state) << '"';
        if (ev.reason) {
            os << ",\"reason\":\"" << json_escape(*ev.reason) << '"';
        }
        os << ",\"metadata\":{";
        bool first = true;
        for (const auto& [key, value] : ev.metadata) {
            if (!first) {
                os << ',';
            }
            first = false;
            os << '"' << json_escape(key) << "\":\"" << json_escape(value) << '"';
        }
        os << "},\"timestamp\":\"" << util::format_iso8601_utc(ev.timestamp) << "\"}\n";
    }
}

void write_export(std::ostream& os, ExportFormat format, std::span<const core::AuditEvent> events) {
    switch (format) {
    case ExportFormat::Csv:
        write_csv(os, events);
        return;
    case ExportFormat::JsonLines:
        write_json_lines(os, events);
        return;
    }
}

} // namespace persist

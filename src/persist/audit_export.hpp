#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "core/audit_event.hpp"

namespace persist {

enum class ExportFormat { Csv, JsonLines };

std::optional<ExportFormat> parse_export_format(std::string_view text) noexcept;

// CSV (RFC 4180 quoting) with header
//   timestamp,project_id,user_id,user_role,from_state,to_state,reason,metadata
// Metadata is rendered as k=v pairs joined by ';'.
void write_csv(std::ostream& os, std::span<const core::AuditEvent> events);

// One JSON object per line with the portal's field names. Timestamps are
// ISO 8601 UTC; a missing reason is omitted, empty metadata is {}.
void write_json_lines(std::ostream& os, std::span<const core::AuditEvent> events);

void write_export(std::ostream& os, ExportFormat format, std::span<const core::AuditEvent> events);

std::string csv_escape(std::string_view field);
std::string json_escape(std::string_view text);

} // namespace persist

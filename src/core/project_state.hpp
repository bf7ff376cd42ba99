#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace core {

// Enumerators are declared in happy-path order; the numeric values are also the
// on-disk encoding used by the audit journal, so never reorder them.
enum class ProjectState : std::uint8_t {
    Requested = 0,
    Assigned = 1,
    Captured = 2,
    Processing = 3,
    QA = 4,
    Delivered = 5,
    Approved = 6,
    Archived = 7,
};

enum class Role : std::uint8_t {
    Admin = 0,
    SalesLead = 1,
    Technician = 2,
    Approver = 3,
    CustomerOwner = 4,
};

inline constexpr std::size_t project_state_count = 8;
inline constexpr std::size_t role_count = 5;

// Enumerator order, which is also the happy path.
inline constexpr std::array<ProjectState, project_state_count> all_project_states{
    ProjectState::Requested, ProjectState::Assigned, ProjectState::Captured, ProjectState::Processing,
    ProjectState::QA,        ProjectState::Delivered, ProjectState::Approved, ProjectState::Archived,
};

inline constexpr std::array<Role, role_count> all_roles{
    Role::Admin, Role::SalesLead, Role::Technician, Role::Approver, Role::CustomerOwner,
};

inline constexpr bool is_known_state(ProjectState s) noexcept {
    return static_cast<std::size_t>(s) < project_state_count;
}

inline constexpr bool is_known_role(Role r) noexcept {
    return static_cast<std::size_t>(r) < role_count;
}

inline constexpr std::size_t state_index(ProjectState s) noexcept { return static_cast<std::size_t>(s); }
inline constexpr std::size_t role_index(Role r) noexcept { return static_cast<std::size_t>(r); }

inline constexpr std::string_view to_string(ProjectState s) noexcept {
    switch (s) {
    case ProjectState::Requested: return "Requested";
    case ProjectState::Assigned: return "Assigned";
    case ProjectState::Captured: return "Captured";
    case ProjectState::Processing: return "Processing";
    case ProjectState::QA: return "QA";
    case ProjectState::Delivered: return "Delivered";
    case ProjectState::Approved: return "Approved";
    case ProjectState::Archived: return "Archived";
    }
    return "Unknown";
}

inline constexpr std::string_view to_string(Role r) noexcept {
    switch (r) {
    case Role::Admin: return "admin";
    case Role::SalesLead: return "sales_lead";
    case Role::Technician: return "technician";
    case Role::Approver: return "approver";
    case Role::CustomerOwner: return "customer_owner";
    }
    return "unknown";
}

namespace detail {
inline constexpr char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}
} // namespace detail

// Case-insensitive; "qa", "QA" and "Qa" all map to ProjectState::QA.
inline constexpr std::optional<ProjectState> parse_project_state(std::string_view text) noexcept {
    for (const auto s : all_project_states) {
        if (detail::iequals(text, to_string(s))) {
            return s;
        }
    }
    return std::nullopt;
}

inline constexpr std::optional<Role> parse_role(std::string_view text) noexcept {
    for (const auto r : all_roles) {
        if (detail::iequals(text, to_string(r))) {
            return r;
        }
    }
    return std::nullopt;
}

} // namespace core

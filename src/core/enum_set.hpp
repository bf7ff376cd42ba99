#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

#include "core/project_state.hpp"

namespace core {

// Fixed-size value set over a dense, zero-based enum with at most 32 enumerators.
// Membership is a single bit test; iteration follows enumerator order.
template <typename E, std::size_t N>
class EnumSet {
    static_assert(std::is_enum_v<E>, "EnumSet requires an enum type");
    static_assert(N > 0 && N <= 32, "EnumSet supports 1..32 enumerators");

public:
    constexpr EnumSet() noexcept = default;
    constexpr EnumSet(std::initializer_list<E> values) noexcept {
        for (const auto v : values) {
            insert(v);
        }
    }

    constexpr void insert(E v) noexcept {
        if (in_range(v)) {
            bits_ |= bit(v);
        }
    }

    constexpr void erase(E v) noexcept {
        if (in_range(v)) {
            bits_ &= ~bit(v);
        }
    }

    constexpr bool contains(E v) const noexcept { return in_range(v) && (bits_ & bit(v)) != 0; }
    constexpr bool empty() const noexcept { return bits_ == 0; }
    constexpr std::size_t size() const noexcept { return static_cast<std::size_t>(std::popcount(bits_)); }
    constexpr std::uint32_t bits() const noexcept { return bits_; }

    std::vector<E> to_vector() const {
        std::vector<E> out;
        out.reserve(size());
        for (std::size_t i = 0; i < N; ++i) {
            const auto v = static_cast<E>(i);
            if (contains(v)) {
                out.push_back(v);
            }
        }
        return out;
    }

    // Members joined by ", " in enumerator order, e.g. "admin, sales_lead".
    std::string to_string() const {
        std::string out;
        for (const auto v : to_vector()) {
            if (!out.empty()) {
                out += ", ";
            }
            out += core::to_string(v);
        }
        return out;
    }

    friend constexpr bool operator==(EnumSet, EnumSet) noexcept = default;

private:
    static constexpr bool in_range(E v) noexcept { return static_cast<std::size_t>(v) < N; }
    static constexpr std::uint32_t bit(E v) noexcept { return 1u << static_cast<std::uint32_t>(v); }

    std::uint32_t bits_{0};
};

using RoleSet = EnumSet<Role, role_count>;
using StateSet = EnumSet<ProjectState, project_state_count>;

} // namespace core

#pragma once

#include <cstddef>
#include <cstdint>

namespace persist {

// Little-endian load/store helpers for the audit journal. Byte extraction is
// done with shifts, so the on-disk layout is little endian on any host.

template <typename T>
inline void store_le(T v, std::byte* out) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<std::byte>((static_cast<std::uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
}

template <typename T>
inline T load_le(const std::byte* p) noexcept {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(p[i])) << (8 * i);
    }
    return static_cast<T>(v);
}

inline void store_le16(std::uint16_t v, std::byte* out) noexcept { store_le(v, out); }
inline void store_le32(std::uint32_t v, std::byte* out) noexcept { store_le(v, out); }
inline void store_le64(std::uint64_t v, std::byte* out) noexcept { store_le(v, out); }

inline std::uint16_t load_le16(const std::byte* p) noexcept { return load_le<std::uint16_t>(p); }
inline std::uint32_t load_le32(const std::byte* p) noexcept { return load_le<std::uint32_t>(p); }
inline std::uint64_t load_le64(const std::byte* p) noexcept { return load_le<std::uint64_t>(p); }

} // namespace persist

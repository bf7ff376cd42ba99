#pragma once

#include <type_traits>

namespace core {

// Behaviour switches for the commit layer (ProjectRegistry).
struct LifecycleConfig {
    // Same-state requests are always valid. When set, the registry also appends
    // an audit event for them; by default a duplicate submit leaves no trace.
    bool record_noop_transitions{false};

    // Log rejected transitions at Info instead of Debug.
    bool log_rejections{false};
};

static_assert(std::is_trivially_copyable_v<LifecycleConfig>, "LifecycleConfig must be trivially copyable");

[[nodiscard]] inline constexpr LifecycleConfig default_lifecycle_config() noexcept {
    return LifecycleConfig{};
}

} // namespace core

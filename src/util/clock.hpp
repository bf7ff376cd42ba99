#pragma once

#include <chrono>

namespace util {

// Wall clock seam so audit timestamps and journal file rotation can be driven
// deterministically from tests.
class SystemClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;
    virtual time_point now() const noexcept { return std::chrono::system_clock::now(); }
};

// Returns a process-lifetime clock backed by std::chrono::system_clock.
inline const SystemClock& default_system_clock() noexcept {
    static const SystemClock clock;
    return clock;
}

} // namespace util

#pragma once

#include <chrono>
#include <cstdint>

namespace fraudshield::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;

inline MonoTime now() noexcept {
    return MonoClock::now();
}

inline uint64_t elapsed_us(MonoTime since) noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            MonoClock::now() - since
        ).count()
    );
}

} // namespace fraudshield::infra

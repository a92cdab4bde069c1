#pragma once

#include <chrono>
#include <cstdint>

namespace rigsense::infra {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;
using MonoDur   = MonoClock::duration;

inline MonoTime now() noexcept {
    return MonoClock::now();
}

// Wall clock in milliseconds. Timestamps on records (alerts, feedback,
// predictions, saved state, simulated samples) and alert age. Cycle
// deadlines, latency and uptime run on now().
inline uint64_t wall_ms() noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace rigsense::infra

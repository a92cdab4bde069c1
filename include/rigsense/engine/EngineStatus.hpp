#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "rigsense/alerts/Alert.hpp"

namespace rigsense {

// Counters and last-cycle gauges behind /status and /metrics.
// Counters are lock-free; the gauge block takes the mutex.
class EngineStatus {
public:
    std::atomic<uint64_t> cycles{0};
    std::atomic<uint64_t> windows_skipped{0};
    std::atomic<uint64_t> agent_timeouts{0};
    std::atomic<uint64_t> agent_unavailable{0};
    std::atomic<uint64_t> invalid_windows{0};
    std::atomic<uint64_t> predictions_accepted{0};
    std::atomic<uint64_t> physics_rejections{0};
    std::atomic<uint64_t> alerts_raised{0};
    std::atomic<uint64_t> alerts_refreshed{0};
    std::atomic<uint64_t> alerts_expired{0};
    std::atomic<uint64_t> feedback_consumed{0};
    std::atomic<uint64_t> adaptation_accepted{0};
    std::atomic<uint64_t> adaptation_rejected{0};

    void set_last_cycle(uint64_t cycle, uint64_t window_sequence, uint64_t latency_us);
    void set_health(const HealthFlags& h);
    void set_pending_alerts(size_t n);
    void set_uptime(uint64_t sec);

    HealthFlags health() const;

    std::string to_json() const;
    std::string to_prometheus() const;

private:
    mutable std::mutex mtx_;
    uint64_t last_cycle_{0};
    uint64_t last_window_{0};
    uint64_t last_latency_us_{0};
    uint64_t uptime_sec_{0};
    size_t pending_alerts_{0};
    HealthFlags health_;
};

} // namespace rigsense

#include "rigsense/engine/EngineStatus.hpp"
#include "rigsense/alerts/AlertJson.hpp"

#include <boost/json.hpp>

#include <sstream>

namespace json = boost::json;

namespace rigsense {

void EngineStatus::set_last_cycle(uint64_t cycle, uint64_t window_sequence, uint64_t latency_us) {
    std::lock_guard<std::mutex> lock(mtx_);
    last_cycle_ = cycle;
    last_window_ = window_sequence;
    last_latency_us_ = latency_us;
}

void EngineStatus::set_health(const HealthFlags& h) {
    std::lock_guard<std::mutex> lock(mtx_);
    health_ = h;
}

void EngineStatus::set_pending_alerts(size_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_alerts_ = n;
}

void EngineStatus::set_uptime(uint64_t sec) {
    std::lock_guard<std::mutex> lock(mtx_);
    uptime_sec_ = sec;
}

HealthFlags EngineStatus::health() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return health_;
}

std::string EngineStatus::to_json() const {
    std::lock_guard<std::mutex> lock(mtx_);

    json::object counters;
    counters["cycles"] = cycles.load();
    counters["windows_skipped"] = windows_skipped.load();
    counters["agent_timeouts"] = agent_timeouts.load();
    counters["agent_unavailable"] = agent_unavailable.load();
    counters["invalid_windows"] = invalid_windows.load();
    counters["predictions_accepted"] = predictions_accepted.load();
    counters["physics_rejections"] = physics_rejections.load();
    counters["alerts_raised"] = alerts_raised.load();
    counters["alerts_refreshed"] = alerts_refreshed.load();
    counters["alerts_expired"] = alerts_expired.load();
    counters["feedback_consumed"] = feedback_consumed.load();
    counters["adaptation_accepted"] = adaptation_accepted.load();
    counters["adaptation_rejected"] = adaptation_rejected.load();

    json::object root;
    root["uptime"] = uptime_sec_;
    root["last_cycle"] = last_cycle_;
    root["last_window"] = last_window_;
    root["last_cycle_latency_us"] = last_latency_us_;
    root["pending_alerts"] = static_cast<uint64_t>(pending_alerts_);
    root["health"] = alert_json::toJson(health_);
    root["counters"] = std::move(counters);
    return json::serialize(root);
}

std::string EngineStatus::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ostringstream out;
    out << "rigsense_uptime " << uptime_sec_ << "\n"
        << "rigsense_last_cycle " << last_cycle_ << "\n"
        << "rigsense_cycle_latency_us " << last_latency_us_ << "\n"
        << "rigsense_pending_alerts " << pending_alerts_ << "\n"
        << "rigsense_cycles_total " << cycles.load() << "\n"
        << "rigsense_windows_skipped_total " << windows_skipped.load() << "\n"
        << "rigsense_agent_timeouts_total " << agent_timeouts.load() << "\n"
        << "rigsense_agent_unavailable_total " << agent_unavailable.load() << "\n"
        << "rigsense_invalid_windows_total " << invalid_windows.load() << "\n"
        << "rigsense_predictions_accepted_total " << predictions_accepted.load() << "\n"
        << "rigsense_physics_rejections_total " << physics_rejections.load() << "\n"
        << "rigsense_alerts_raised_total " << alerts_raised.load() << "\n"
        << "rigsense_alerts_refreshed_total " << alerts_refreshed.load() << "\n"
        << "rigsense_alerts_expired_total " << alerts_expired.load() << "\n"
        << "rigsense_feedback_consumed_total " << feedback_consumed.load() << "\n"
        << "rigsense_adaptation_accepted_total " << adaptation_accepted.load() << "\n"
        << "rigsense_adaptation_rejected_total " << adaptation_rejected.load() << "\n"
        << "rigsense_global_degraded " << (health_.global_degraded ? 1 : 0) << "\n";

    for (Category c : kAllCategories) {
        out << "rigsense_category_degraded{category=\"" << toString(c) << "\"} "
            << (health_.degradedFor(c) ? 1 : 0) << "\n";
    }
    for (const auto& a : health_.diverged_agents) {
        out << "rigsense_model_divergence{agent=\"" << a << "\"} 1\n";
    }
    return out.str();
}

} // namespace rigsense

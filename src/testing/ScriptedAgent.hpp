#pragma once

// Test-only adapter with a scripted score sequence, plus window builders.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rigsense/agents/AgentAdapter.hpp"
#include "rigsense/core/Errors.hpp"

namespace rigsense {
namespace testing {

class ScriptedAgent : public AgentAdapter {
public:
    ScriptedAgent(
        std::string name,
        Category category,
        std::vector<double> scores
    ) : AgentAdapter(std::move(name), category, defaultState()),
        scores_(std::move(scores)) {}

    static AgentModelState defaultState() {
        AgentModelState s;
        s.sensitivity = 0.5;
        s.reliability = 1.0;
        s.bias = 0.0;
        return s;
    }

    // Score for call n is scores[min(n, size - 1)].
    void setScores(std::vector<double> scores) {
        std::lock_guard<std::mutex> lk(mtx_);
        scores_ = std::move(scores);
    }

    void setDelay(std::chrono::milliseconds d) { delay_ms_.store(d.count()); }
    void failWith(AgentFault f) { fault_.store(static_cast<int>(f)); }
    void recover() { fault_.store(0); }

    // Extra residual attached to every prediction, e.g. an impossible mass gain.
    void setResidual(const std::string& key, double value) {
        std::lock_guard<std::mutex> lk(mtx_);
        residual_key_ = key;
        residual_value_ = value;
    }

    size_t calls() const { return calls_.load(); }

protected:
    std::vector<Channel> requiredChannels() const override { return {}; }

    Inference infer(
        const WindowFeatures&,
        const AgentModelState&
    ) const override {
        size_t n = calls_.fetch_add(1);

        long long delay = delay_ms_.load();
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        int fault = fault_.load();
        if (fault != 0) {
            throw AgentError(static_cast<AgentFault>(fault), name() + " scripted fault");
        }

        Inference out;
        std::lock_guard<std::mutex> lk(mtx_);
        if (scores_.empty()) {
            throw AgentError(AgentFault::AgentUnavailable, name() + " has no script");
        }
        out.score = scores_[std::min(n, scores_.size() - 1)];
        out.evidence.issue = "Scripted";
        out.evidence.factors.push_back(EvidenceFactor{"Scripted Score", out.score, ""});
        if (!residual_key_.empty()) {
            out.evidence.residuals[residual_key_] = residual_value_;
        }
        return out;
    }

private:
    mutable std::mutex mtx_;
    std::vector<double> scores_;
    std::string residual_key_;
    double residual_value_ = 0.0;
    mutable std::atomic<size_t> calls_{0};
    std::atomic<long long> delay_ms_{0};
    std::atomic<int> fault_{0};
};

// Nominal drilling sample; `tweak` edits it per index.
inline TelemetrySample nominalSample(uint64_t ts_ms) {
    TelemetrySample s;
    s.ts_ms = ts_ms;
    s.depth_ft = 10000.0;
    s.wob_klbs = 25.0;
    s.rpm = 120.0;
    s.torque_kftlbs = 8.0;
    s.spp_psi = 3500.0;
    s.flow_in_gpm = 600.0;
    s.flow_out_gpm = 597.0;
    s.mud_density_ppg = 10.5;
    s.ecd_ppg = 10.8;
    s.rop_fthr = 60.0;
    s.hook_load_klbs = 200.0;
    return s;
}

inline WindowPtr makeWindow(
    uint64_t sequence,
    uint64_t window_ms,
    size_t samples = 12,
    const std::function<void(size_t, TelemetrySample&)>& tweak = nullptr
) {
    uint64_t end = sequence * window_ms;
    uint64_t start = end - window_ms;
    std::vector<TelemetrySample> out;
    for (size_t i = 0; i < samples; ++i) {
        TelemetrySample s = nominalSample(start + (i + 1) * window_ms / samples);
        if (tweak) tweak(i, s);
        out.push_back(s);
    }
    return std::make_shared<const TelemetryWindow>(sequence, start, end, std::move(out));
}

} // namespace testing
} // namespace rigsense

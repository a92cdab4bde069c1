#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "rigsense/telemetry/WindowSource.hpp"

namespace rigsense {

enum class Scenario : uint8_t {
    None = 0,
    Sticking,
    MudLoss,
    Washout,
    HoleCleaning
};

const char* toString(Scenario s);
bool parseScenario(const std::string& text, Scenario& out);

struct SimulationConfig {
    bool enabled = true;
    uint32_t seed = 42;
    uint32_t samples_per_window = 12;
    uint64_t window_ms = 60000;
    uint64_t start_ms = 0;            // 0 = wall clock at construction
    uint64_t max_windows = 0;         // 0 = endless
    Scenario scenario = Scenario::None;
    uint64_t scenario_start_window = 3;
};

// ---------------------------------------------------------------------------
// Synthetic rig feed around nominal drilling parameters:
//   depth 10000 ft, WOB 25 klbs, ROP 60 ft/hr, RPM 120, torque 8 kft-lbs,
//   flow 600 gpm, SPP 3500 psi at nominal flow, ECD 10.8 ppg, hook 200 klbs.
// From scenario_start_window on, the configured anomaly is injected.
// Deterministic for a given seed; windows advance in simulated time.
// ---------------------------------------------------------------------------
class SimulatedFeed : public WindowSource {
public:
    explicit SimulatedFeed(SimulationConfig cfg);

    WindowPtr next() override;

    uint64_t produced() const { return sequence_; }

private:
    TelemetrySample sample(uint64_t ts_ms, double progress, bool anomalous);
    double jitter(double span);

    SimulationConfig cfg_;
    std::mt19937 rng_;
    uint64_t sequence_ = 0;
    uint64_t clock_ms_;
    double depth_ft_ = 10000.0;
};

} // namespace rigsense

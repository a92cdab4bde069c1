#include "rigsense/telemetry/SimulatedFeed.hpp"
#include "rigsense/core/Clock.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace rigsense {

const char* toString(Scenario s) {
    switch (s) {
        case Scenario::None:         return "none";
        case Scenario::Sticking:     return "sticking";
        case Scenario::MudLoss:      return "mud_loss";
        case Scenario::Washout:      return "washout";
        case Scenario::HoleCleaning: return "hole_cleaning";
    }
    return "none";
}

bool parseScenario(const std::string& text, Scenario& out) {
    for (Scenario s : {Scenario::None, Scenario::Sticking, Scenario::MudLoss,
                       Scenario::Washout, Scenario::HoleCleaning}) {
        if (text == toString(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

SimulatedFeed::SimulatedFeed(SimulationConfig cfg)
    : cfg_(cfg),
      rng_(cfg.seed),
      clock_ms_(cfg.start_ms ? cfg.start_ms : infra::wall_ms()) {
    if (cfg_.samples_per_window == 0) cfg_.samples_per_window = 1;
    std::cout << "[FEED] simulated feed seed=" << cfg_.seed
              << " scenario=" << toString(cfg_.scenario)
              << " from window " << cfg_.scenario_start_window << "\n";
}

double SimulatedFeed::jitter(double span) {
    std::uniform_real_distribution<double> d(-span, span);
    return d(rng_);
}

WindowPtr SimulatedFeed::next() {
    if (cfg_.max_windows && sequence_ >= cfg_.max_windows) return nullptr;

    uint64_t seq = ++sequence_;
    bool anomalous = cfg_.scenario != Scenario::None &&
                     seq >= cfg_.scenario_start_window;

    uint64_t start = clock_ms_;
    uint64_t step = cfg_.window_ms / cfg_.samples_per_window;
    std::vector<TelemetrySample> samples;
    samples.reserve(cfg_.samples_per_window);

    for (uint32_t i = 0; i < cfg_.samples_per_window; ++i) {
        double progress = cfg_.samples_per_window > 1
            ? static_cast<double>(i) / (cfg_.samples_per_window - 1)
            : 1.0;
        samples.push_back(sample(start + (i + 1) * step, progress, anomalous));
    }

    clock_ms_ = start + cfg_.window_ms;
    return std::make_shared<const TelemetryWindow>(
        seq, start, clock_ms_, std::move(samples));
}

TelemetrySample SimulatedFeed::sample(uint64_t ts_ms, double progress, bool anomalous) {
    TelemetrySample s;
    s.ts_ms = ts_ms;

    depth_ft_ += 0.2 + jitter(0.1);
    s.depth_ft = depth_ft_;
    s.wob_klbs = 25.0 + jitter(2.0);
    s.rop_fthr = 60.0 + jitter(5.0);
    s.rpm = 120.0 + jitter(5.0);
    s.torque_kftlbs = 8.0 + jitter(0.3);
    s.flow_in_gpm = 600.0 + jitter(10.0);
    s.mud_density_ppg = 10.5;
    s.ecd_ppg = 10.8 + jitter(0.1);
    s.hook_load_klbs = 200.0 + jitter(5.0);

    double returns = 0.99;

    if (anomalous) {
        switch (cfg_.scenario) {
            case Scenario::Sticking:
                // Torque climbing through the window, erratic rotary, heavy ECD.
                s.torque_kftlbs += 4.0 * progress;
                s.rpm += jitter(30.0);
                s.ecd_ppg = 12.6 + jitter(0.1);
                break;
            case Scenario::MudLoss:
                returns = 0.95 - 0.25 * progress;
                s.flow_in_gpm -= 60.0 * progress;
                s.ecd_ppg = 13.5 + jitter(0.1);
                break;
            case Scenario::Washout:
                s.flow_in_gpm += 40.0 * progress;
                break;
            case Scenario::HoleCleaning:
                s.flow_in_gpm = 380.0 - 60.0 * progress + jitter(5.0);
                s.rpm = 50.0 + jitter(3.0);
                s.rop_fthr = 90.0 + 20.0 * progress;
                break;
            case Scenario::None:
                break;
        }
    }

    // Pump pressure follows Q^1.8 around the nominal point.
    s.spp_psi = 3500.0 * std::pow(s.flow_in_gpm / 600.0, 1.8) + jitter(50.0);
    if (anomalous && cfg_.scenario == Scenario::Washout) {
        // Hole in the string: pressure bleeds off at steady pump rate.
        s.spp_psi *= 1.0 - 0.15 * progress;
    }
    s.flow_out_gpm = s.flow_in_gpm * (returns + jitter(0.005));
    return s;
}

} // namespace rigsense

#pragma once

#include <array>
#include <vector>

#include "rigsense/telemetry/TelemetryWindow.hpp"

namespace rigsense {

struct ChannelStats {
    double latest = kMissing;
    double first = kMissing;
    double mean = kMissing;
    double stddev = 0.0;
    double delta = 0.0;      // latest - first over the window
    size_t valid = 0;        // finite readings
};

// ---------------------------------------------------------------------------
// Derived drilling quantities shared by the reference agents.
//
// Formulas follow standard rig-floor rules of thumb:
//   MSE            = 4 WOB / (pi d^2) + 480 RPM T / (pi d^2 ROP)   (psi)
//   dP overbalance = 0.052 ECD depth - 0.45 depth                  (psi)
//   hole cleaning  = 0.5 + 0.3 Q/800 + 0.2 RPM/150 - 0.1 ROP/50    [0.1, 1]
//   drag factor    = hook load / (depth * 20 lb/ft)                [0.1, 1]
//   mass balance   = mean((Q_in - Q_out) / Q_in)
//   hydraulic      = SPP / (SPP_mean (Q / Q_mean)^1.8) - 1
//
// compute() throws AgentError(InvalidWindow) when the window is empty,
// unordered, or a required channel has no finite reading.
// ---------------------------------------------------------------------------
struct WindowFeatures {
    static constexpr double kBitDiameterIn = 8.5;

    std::array<ChannelStats, kChannelCount> channels;

    double coverage = 0.0;
    double mse_psi = 0.0;
    double differential_pressure_psi = 0.0;
    double hole_cleaning_index = 0.1;
    double drag_factor = 0.1;
    double mass_balance_residual = kMissing;
    double hydraulic_residual = 0.0;

    const ChannelStats& stats(Channel c) const {
        return channels[static_cast<size_t>(c)];
    }

    // Latest finite reading, or `fallback` when the channel is absent.
    double latest(Channel c, double fallback = 0.0) const;
    double mean(Channel c, double fallback = 0.0) const;
    double delta(Channel c) const { return stats(c).delta; }

    bool hasFlowOut() const;

    static WindowFeatures compute(
        const TelemetryWindow& window,
        const std::vector<Channel>& required
    );
};

} // namespace rigsense

#include "rigsense/telemetry/WindowFeatures.hpp"
#include "rigsense/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace rigsense {

namespace {

constexpr double kPi = 3.14159265358979;

ChannelStats channelStats(const TelemetryWindow& window, Channel c) {
    ChannelStats s;
    double sum = 0.0;
    double sum_sq = 0.0;

    for (const auto& sample : window.samples()) {
        double v = sample.value(c);
        if (!std::isfinite(v)) continue;
        if (s.valid == 0) s.first = v;
        s.latest = v;
        sum += v;
        sum_sq += v * v;
        s.valid++;
    }

    if (s.valid > 0) {
        double n = static_cast<double>(s.valid);
        s.mean = sum / n;
        double var = sum_sq / n - s.mean * s.mean;
        s.stddev = var > 0.0 ? std::sqrt(var) : 0.0;
        s.delta = s.latest - s.first;
    }
    return s;
}

double clamp(double v, double lo, double hi) {
    return std::min(hi, std::max(lo, v));
}

} // namespace

double WindowFeatures::latest(Channel c, double fallback) const {
    const ChannelStats& s = stats(c);
    return s.valid > 0 ? s.latest : fallback;
}

double WindowFeatures::mean(Channel c, double fallback) const {
    const ChannelStats& s = stats(c);
    return s.valid > 0 ? s.mean : fallback;
}

bool WindowFeatures::hasFlowOut() const {
    return std::isfinite(mass_balance_residual);
}

WindowFeatures WindowFeatures::compute(
    const TelemetryWindow& window,
    const std::vector<Channel>& required
) {
    if (window.empty()) {
        throw AgentError(AgentFault::InvalidWindow,
            "window " + std::to_string(window.sequence()) + " has no samples");
    }
    if (!window.ordered()) {
        throw AgentError(AgentFault::InvalidWindow,
            "window " + std::to_string(window.sequence()) + " samples out of order");
    }

    WindowFeatures f;
    for (size_t i = 0; i < kChannelCount; ++i) {
        f.channels[i] = channelStats(window, static_cast<Channel>(i));
    }

    for (Channel c : required) {
        if (f.stats(c).valid == 0) {
            throw AgentError(AgentFault::InvalidWindow,
                std::string("window missing channel ") + toString(c));
        }
    }

    // Negative depth or pump rate is a sensor fault, not a drilling state.
    if (f.latest(Channel::Depth) < 0.0 || f.latest(Channel::FlowIn) < 0.0) {
        throw AgentError(AgentFault::InvalidWindow,
            "window " + std::to_string(window.sequence()) + " has negative depth or flow");
    }

    size_t complete = 0;
    for (const auto& sample : window.samples()) {
        bool ok = true;
        for (Channel c : required) {
            if (!sample.has(c)) { ok = false; break; }
        }
        if (ok) complete++;
    }
    f.coverage = static_cast<double>(complete) /
                 static_cast<double>(window.size());

    double wob = f.latest(Channel::Wob);
    double rpm = f.latest(Channel::Rpm);
    double torque = f.latest(Channel::Torque);
    double rop = f.latest(Channel::Rop);
    double flow = f.latest(Channel::FlowIn);
    double depth = f.latest(Channel::Depth);
    double ecd = f.latest(Channel::Ecd);
    double hook = f.latest(Channel::HookLoad);

    double area = kPi * kBitDiameterIn * kBitDiameterIn;
    if (rop > 0.0) {
        f.mse_psi = 4.0 * wob * 1000.0 / area +
                    (480.0 * rpm * torque) / (area * rop);
    }

    if (ecd > 0.0 && depth > 0.0) {
        double hydrostatic = 0.052 * ecd * depth;
        double pore = 0.45 * depth;
        f.differential_pressure_psi = std::max(0.0, hydrostatic - pore);
    }

    if (flow > 0.0 && rpm > 0.0) {
        f.hole_cleaning_index = clamp(
            0.5 + 0.3 * (flow / 800.0) + 0.2 * (rpm / 150.0) - 0.1 * (rop / 50.0),
            0.1, 1.0);
    }

    if (hook > 0.0 && depth > 0.0) {
        double theoretical = depth * 0.02;
        f.drag_factor = clamp(hook / theoretical, 0.1, 1.0);
    }

    double imbalance_sum = 0.0;
    size_t imbalance_n = 0;
    for (const auto& sample : window.samples()) {
        if (!sample.has(Channel::FlowIn) || !sample.has(Channel::FlowOut)) continue;
        if (sample.flow_in_gpm <= 0.0) continue;
        imbalance_sum += (sample.flow_in_gpm - sample.flow_out_gpm) / sample.flow_in_gpm;
        imbalance_n++;
    }
    if (imbalance_n > 0) {
        f.mass_balance_residual = imbalance_sum / static_cast<double>(imbalance_n);
    }

    double spp = f.latest(Channel::Spp);
    double spp_mean = f.mean(Channel::Spp);
    double flow_mean = f.mean(Channel::FlowIn);
    if (spp > 0.0 && spp_mean > 0.0 && flow > 0.0 && flow_mean > 0.0) {
        double expected = spp_mean * std::pow(flow / flow_mean, 1.8);
        f.hydraulic_residual = spp / expected - 1.0;
    }

    return f;
}

} // namespace rigsense

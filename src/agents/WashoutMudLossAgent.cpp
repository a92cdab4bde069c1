#include "rigsense/agents/WashoutMudLossAgent.hpp"

#include <algorithm>
#include <cmath>

namespace rigsense {

namespace {

constexpr double kLossEcdPpg = 12.0;

// Return-flow deficit that counts as a full loss signal.
constexpr double kFullDeficit = 0.1;

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

AgentModelState WashoutMudLossAgent::defaultState(double sensitivity) {
    AgentModelState s;
    s.sensitivity = sensitivity;
    s.reliability = 0.8;
    s.weights = {0.5, 0.3, 0.2, 0.4, 0.3, 0.3};
    return s;
}

WashoutMudLossAgent::WashoutMudLossAgent(double sensitivity)
    : AgentAdapter(agent_names::kWashoutMudLoss,
                   Category::WashoutMudLoss,
                   defaultState(sensitivity)) {}

std::vector<Channel> WashoutMudLossAgent::requiredChannels() const {
    return {Channel::Spp, Channel::FlowIn};
}

Inference WashoutMudLossAgent::infer(
    const WindowFeatures& f,
    const AgentModelState& state
) const {
    Inference out;
    Evidence& e = out.evidence;

    const ChannelStats& spp = f.stats(Channel::Spp);
    const ChannelStats& flow = f.stats(Channel::FlowIn);
    const ChannelStats& torque = f.stats(Channel::Torque);
    double ecd = f.latest(Channel::Ecd);

    // Washout: pressure falls while pumps hold or rise.
    double spp_drop = 0.0;
    if (spp.delta < 0.0 && spp.mean > 0.0) {
        spp_drop = clamp01(std::fabs(spp.delta) / (spp.mean * 0.1));
    }
    double flow_pressure = 0.0;
    if (spp.delta < 0.0 && flow.delta > 0.0) {
        flow_pressure = clamp01((flow.delta / 20.0) * std::fabs(spp.delta / 100.0));
    }
    double torque_instability = 0.0;
    if (torque.valid > 0 && torque.mean > 0.0) {
        torque_instability = clamp01(std::fabs(torque.delta) / (torque.mean * 0.2 + 0.1));
    }

    double washout = weight(state, 0, 0.5) * spp_drop +
                     weight(state, 1, 0.3) * flow_pressure +
                     weight(state, 2, 0.2) * torque_instability;
    washout = applySensitivity(washout, state.sensitivity);

    // Losses: pump rate or returns fall away.
    double flow_loss = 0.0;
    if (flow.delta < 0.0 && flow.mean > 0.0) {
        flow_loss = clamp01(std::fabs(flow.delta) / (flow.mean * 0.1));
    }
    if (f.hasFlowOut() && f.mass_balance_residual > 0.0) {
        flow_loss = std::max(flow_loss, clamp01(f.mass_balance_residual / kFullDeficit));
    }
    double pressure_flow = 0.0;
    if (spp.delta < 0.0 && flow.delta < 0.0) {
        double contribution = std::fabs(flow.delta) / (flow.mean * 0.1 + 0.1);
        pressure_flow = clamp01(contribution * std::fabs(spp.delta / 100.0));
    }
    double ecd_factor = ecd > kLossEcdPpg ? clamp01((ecd - kLossEcdPpg) / 3.0) : 0.0;

    double losses = weight(state, 3, 0.4) * flow_loss +
                    weight(state, 4, 0.3) * pressure_flow +
                    weight(state, 5, 0.3) * ecd_factor;
    losses = applySensitivity(losses, state.sensitivity);

    if (washout > losses) {
        e.issue = "Washout";
        if (spp_drop > 0.5) {
            addFactor(e, "Standpipe Pressure Drop", spp.delta, "psi",
                "Monitor for surface pressure fluctuations");
        }
        if (flow_pressure > 0.5) {
            addFactor(e, "Flow-Pressure Anomaly", flow_pressure, "",
                "Check for inconsistent flow and pressure relationships");
        }
        if (torque_instability > 0.5) {
            addFactor(e, "Torque Instability", torque.delta, "kft-lbs",
                "Watch for erratic torque behavior");
        }
        if (e.recommendations.empty()) {
            e.recommendations.emplace_back("Perform flow check to confirm washout");
            e.recommendations.emplace_back("Prepare to pull out of hole if washout confirmed");
        }
    } else {
        e.issue = "Mud Losses";
        if (flow_loss > 0.5) {
            addFactor(e, "Flow Return Decrease", flow.delta, "gpm",
                "Monitor pit volume and flow returns closely");
        }
        if (pressure_flow > 0.5) {
            addFactor(e, "Pressure-Flow Correlation", pressure_flow, "",
                "Check for simultaneous pressure and flow decreases");
        }
        if (ecd_factor > 0.5) {
            addFactor(e, "High ECD", ecd, "ppg",
                "Consider reducing mud weight or ECD");
        }
        if (e.recommendations.empty()) {
            e.recommendations.emplace_back("Perform flow check to confirm losses");
            e.recommendations.emplace_back(
                "Prepare loss circulation material (LCM) if losses confirmed");
        }
    }

    e.features["washout_score"] = washout;
    e.features["mud_loss_score"] = losses;
    attachPhysicsResiduals(f, e);

    out.score = std::max(washout, losses);
    return out;
}

} // namespace rigsense

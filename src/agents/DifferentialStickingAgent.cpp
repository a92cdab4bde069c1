#include "rigsense/agents/DifferentialStickingAgent.hpp"

#include <algorithm>

namespace rigsense {

namespace {

constexpr double kHighOverbalancePsi = 1000.0;
constexpr double kEcdLowPpg = 10.0;
constexpr double kEcdSpanPpg = 3.0;
constexpr double kFullFlowGpm = 800.0;

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

AgentModelState DifferentialStickingAgent::defaultState(double sensitivity) {
    AgentModelState s;
    s.sensitivity = sensitivity;
    s.reliability = 0.8;
    s.weights = {0.4, 0.3, 0.2, 0.1};
    return s;
}

DifferentialStickingAgent::DifferentialStickingAgent(double sensitivity)
    : AgentAdapter(agent_names::kDifferentialSticking,
                   Category::Sticking,
                   defaultState(sensitivity)) {}

std::vector<Channel> DifferentialStickingAgent::requiredChannels() const {
    return {Channel::Depth, Channel::Ecd};
}

Inference DifferentialStickingAgent::infer(
    const WindowFeatures& f,
    const AgentModelState& state
) const {
    Inference out;
    Evidence& e = out.evidence;
    e.issue = "Differential Sticking";

    double dp = f.differential_pressure_psi;
    double ecd = f.latest(Channel::Ecd);
    double flow = f.latest(Channel::FlowIn);
    double depth = f.latest(Channel::Depth);
    double hook = f.latest(Channel::HookLoad);

    double base = clamp01(std::min(1.0, dp / kHighOverbalancePsi) * 0.8);

    double ecd_factor = 0.0;
    if (ecd > 0.0) {
        ecd_factor = clamp01((ecd - kEcdLowPpg) / kEcdSpanPpg);
    }

    double flow_factor = 0.0;
    if (flow > 0.0) {
        flow_factor = clamp01(1.0 - flow / kFullFlowGpm);
    }

    // Light hook load against string weight means weight sits on the
    // formation side of the hole.
    double stationary = 0.0;
    if (depth > 0.0 && hook > 0.0) {
        stationary = clamp01(1.0 - hook / (depth * 0.02));
    }

    double p = weight(state, 0, 0.4) * base +
               weight(state, 1, 0.3) * ecd_factor +
               weight(state, 2, 0.2) * flow_factor +
               weight(state, 3, 0.1) * stationary;
    p = applySensitivity(p, state.sensitivity);

    if (dp > 500.0) {
        addFactor(e, "High Differential Pressure", dp, "psi",
            "Reduce mud weight to decrease differential pressure");
    }
    if (ecd_factor > 0.5) {
        addFactor(e, "High ECD", ecd, "ppg",
            "Reduce ECD by adjusting mud properties or reducing pump rate");
    }
    if (flow_factor > 0.6) {
        addFactor(e, "Low Flow Rate", flow, "gpm",
            "Increase flow rate to improve filter cake management");
    }
    if (stationary > 0.5) {
        addFactor(e, "Extended Stationary Time", stationary, "",
            "Keep pipe moving to prevent embedment in filter cake");
    }
    if (p > 0.7 && e.recommendations.empty()) {
        e.recommendations.emplace_back(
            "Monitor for signs of differential sticking: overpull, high torque, no reciprocation");
        e.recommendations.emplace_back(
            "Consider reducing mud weight and keeping pipe moving");
    }

    e.features["ecd_factor"] = ecd_factor;
    e.features["stationary_factor"] = stationary;
    attachPhysicsResiduals(f, e);

    out.score = p;
    return out;
}

} // namespace rigsense

#include "rigsense/agents/HoleCleaningAgent.hpp"

#include <algorithm>
#include <cmath>

namespace rigsense {

namespace {

// Below this depth the section is treated as building angle; past it as
// near-horizontal.
constexpr double kHorizontalDepthFt = 8000.0;
constexpr double kOptimalEcdPpg = 11.5;

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

AgentModelState HoleCleaningAgent::defaultState(double sensitivity) {
    AgentModelState s;
    s.sensitivity = sensitivity;
    s.reliability = 0.8;
    s.weights = {0.3, 0.2, 0.1, 0.2, 0.1, 0.1};
    return s;
}

HoleCleaningAgent::HoleCleaningAgent(double sensitivity)
    : AgentAdapter(agent_names::kHoleCleaning,
                   Category::HoleCleaning,
                   defaultState(sensitivity)) {}

std::vector<Channel> HoleCleaningAgent::requiredChannels() const {
    return {Channel::FlowIn, Channel::Rpm, Channel::Rop};
}

Inference HoleCleaningAgent::infer(
    const WindowFeatures& f,
    const AgentModelState& state
) const {
    Inference out;
    Evidence& e = out.evidence;
    e.issue = "Hole Cleaning";

    double hci = f.hole_cleaning_index;
    double rop = f.latest(Channel::Rop);
    double rpm = f.latest(Channel::Rpm);
    double flow = f.latest(Channel::FlowIn);
    double ecd = f.latest(Channel::Ecd);
    double depth = f.latest(Channel::Depth);

    double base = hci > 0.0 ? clamp01(1.0 - hci) : 0.5;
    double rop_factor = rop > 0.0 ? clamp01(rop / 100.0) : 0.0;
    double rpm_factor = rpm > 0.0 ? clamp01(1.0 - rpm / 150.0) : 0.0;
    double flow_factor = flow > 0.0 ? clamp01(1.0 - flow / 800.0) : 0.0;
    double ecd_factor = ecd > 0.0 ? clamp01(std::fabs(ecd - kOptimalEcdPpg) / 3.0) : 0.0;

    double angle_factor = depth > kHorizontalDepthFt
        ? 0.8
        : std::min(0.6, std::max(0.1, depth / 10000.0));

    double p = weight(state, 0, 0.3) * base +
               weight(state, 1, 0.2) * rop_factor +
               weight(state, 2, 0.1) * rpm_factor +
               weight(state, 3, 0.2) * flow_factor +
               weight(state, 4, 0.1) * ecd_factor +
               weight(state, 5, 0.1) * angle_factor;
    p = applySensitivity(p, state.sensitivity);

    // Cuttings load rising faster than the hole can be cleaned.
    if (f.delta(Channel::Rop) > 5.0) p = std::min(1.0, p + 0.1);
    if (f.delta(Channel::FlowIn) < -20.0) p = std::min(1.0, p + 0.1);

    if (hci > 0.0 && hci < 0.6) {
        addFactor(e, "Low Hole Cleaning Index", hci, "",
            "Increase flow rate and pipe rotation to improve hole cleaning");
    }
    if (rop_factor > 0.7) {
        addFactor(e, "High ROP", rop, "ft/hr",
            "Reduce ROP to prevent excess cuttings generation");
    }
    if (flow_factor > 0.6) {
        addFactor(e, "Low Flow Rate", flow, "gpm",
            "Increase flow rate to improve cuttings removal");
    }
    if (rpm_factor > 0.6) {
        addFactor(e, "Low RPM", rpm, "rpm",
            "Increase rotary speed to improve hole cleaning");
    }
    if (ecd_factor > 0.6) {
        addFactor(e, "Non-optimal ECD", ecd, "ppg",
            "Adjust mud properties to optimize ECD");
    }
    if (angle_factor > 0.7) {
        addFactor(e, "High Hole Angle/Depth", depth, "ft",
            "Increase flowrate and RPM in high-angle sections");
    }
    if (p > 0.7 && e.recommendations.empty()) {
        e.recommendations.emplace_back("Perform wiper trips to clean the hole");
        e.recommendations.emplace_back(
            "Consider optimizing mud properties for better cuttings transport");
    }

    e.residuals["hole_cleaning_index"] = hci;
    attachPhysicsResiduals(f, e);

    out.score = p;
    return out;
}

} // namespace rigsense

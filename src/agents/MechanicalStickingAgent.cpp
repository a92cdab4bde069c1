#include "rigsense/agents/MechanicalStickingAgent.hpp"

#include <algorithm>
#include <cmath>

namespace rigsense {

namespace {

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

AgentModelState MechanicalStickingAgent::defaultState(double sensitivity) {
    AgentModelState s;
    s.sensitivity = sensitivity;
    s.reliability = 0.8;
    s.weights = {0.35, 0.25, 0.25, 0.15};
    return s;
}

MechanicalStickingAgent::MechanicalStickingAgent(double sensitivity)
    : AgentAdapter(agent_names::kMechanicalSticking,
                   Category::Sticking,
                   defaultState(sensitivity)) {}

std::vector<Channel> MechanicalStickingAgent::requiredChannels() const {
    return {Channel::Torque, Channel::Rpm};
}

Inference MechanicalStickingAgent::infer(
    const WindowFeatures& f,
    const AgentModelState& state
) const {
    Inference out;
    Evidence& e = out.evidence;
    e.issue = "Mechanical Sticking";

    const ChannelStats& torque = f.stats(Channel::Torque);
    const ChannelStats& rpm = f.stats(Channel::Rpm);
    double wob = f.latest(Channel::Wob);
    double flow = f.latest(Channel::FlowIn);

    double base = clamp01(f.drag_factor * 0.8);

    double torque_factor = 0.0;
    if (torque.mean > 0.0 && torque.stddev > 0.0) {
        torque_factor = (torque.latest - torque.mean) / (torque.stddev + 1.0);
    }
    double torque_risk = clamp01(0.3 + 0.7 * std::max(0.0, torque_factor));
    double torque_instability = std::min(1.0,
        std::fabs(torque.delta) / (torque.mean * 0.2 + 0.1));

    double rpm_instability = 0.0;
    if (rpm.mean > 0.0 && rpm.stddev > 0.0) {
        rpm_instability = std::min(1.0, std::fabs(rpm.delta) / (rpm.mean * 0.2 + 0.1));
    }

    double p = weight(state, 0, 0.35) * base +
               weight(state, 1, 0.25) * torque_risk +
               weight(state, 2, 0.25) * torque_instability +
               weight(state, 3, 0.15) * rpm_instability;
    p = applySensitivity(p, state.sensitivity);

    if (f.drag_factor > 0.6) {
        addFactor(e, "High Drag Factor", f.drag_factor, "",
            "Work pipe to reduce drag and consider lubricant additives to mud");
    }
    if (torque_risk > 0.5) {
        addFactor(e, "Elevated Torque", torque.latest, "kft-lbs",
            "Reduce weight on bit (WOB) to decrease torque");
    }
    if (torque_instability > 0.6) {
        addFactor(e, "Torque Instability", torque.delta, "kft-lbs",
            "Stabilize drilling parameters and check for formation changes");
    }
    if (rpm_instability > 0.6) {
        addFactor(e, "RPM Instability", rpm.delta, "rpm",
            "Stabilize rotary speed and check for possible vibrations");
    }
    if (flow > 0.0 && flow < 400.0 && p > 0.4) {
        addFactor(e, "Low Flow Rate", flow, "gpm",
            "Increase flow rate to improve hole cleaning");
    }
    if (wob > 30.0 && p > 0.4) {
        addFactor(e, "High WOB", wob, "klbs",
            "Reduce weight on bit (WOB) to decrease mechanical sticking risk");
    }
    if (p > 0.7 && e.recommendations.empty()) {
        e.recommendations.emplace_back(
            "Perform slack-off and pick-up tests to check for potential sticking points");
        e.recommendations.emplace_back(
            "Consider working the pipe and reaming to clean the hole");
    }

    e.features["torque_risk"] = torque_risk;
    e.features["torque_instability"] = torque_instability;
    e.features["rpm_instability"] = rpm_instability;
    attachPhysicsResiduals(f, e);

    out.score = p;
    return out;
}

} // namespace rigsense

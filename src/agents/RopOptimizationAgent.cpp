#include "rigsense/agents/RopOptimizationAgent.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rigsense {

namespace {

constexpr double kLowEfficiency = 0.7;

std::string setpointText(const char* verb, const char* what, double value, int precision, const char* unit) {
    std::ostringstream os;
    os << verb << " " << what << " to " << std::fixed << std::setprecision(precision) << value;
    if (unit[0] != '\0') os << " " << unit;
    return os.str();
}

} // namespace

AgentModelState RopOptimizationAgent::defaultState(double sensitivity) {
    AgentModelState s;
    s.sensitivity = sensitivity;
    s.reliability = 0.8;
    return s;
}

RopOptimizationAgent::RopOptimizationAgent(double sensitivity, RopParams params)
    : AgentAdapter(agent_names::kRopOptimization,
                   Category::Rop,
                   defaultState(sensitivity)),
      params_(params) {}

std::vector<Channel> RopOptimizationAgent::requiredChannels() const {
    return {Channel::Rop, Channel::Wob, Channel::Rpm, Channel::Torque};
}

Inference RopOptimizationAgent::infer(
    const WindowFeatures& f,
    const AgentModelState& state
) const {
    Inference out;
    Evidence& e = out.evidence;
    e.issue = "ROP Optimization";

    double rop = f.latest(Channel::Rop);
    double wob = f.latest(Channel::Wob);
    double rpm = f.latest(Channel::Rpm);
    double torque = f.latest(Channel::Torque);
    double flow = f.latest(Channel::FlowIn);
    double mse = f.mse_psi;

    double optimal_mse = params_.ucs_psi * 0.35;
    double efficiency = 1.0;
    if (mse > 0.0 && optimal_mse > 0.0) {
        efficiency = std::min(1.0, std::max(0.1, optimal_mse / mse));
    }

    double wob_target = wob;
    double rpm_target = rpm;
    double flow_target = flow;
    double wob_gain = 0.0;
    double rpm_gain = 0.0;
    double flow_gain = 0.0;

    if (efficiency < kLowEfficiency && wob > 0.0) {
        double torque_per_wob = torque / (wob + 0.1);
        if (torque_per_wob < 0.3) {
            wob_target = wob * 1.2;
            wob_gain = (wob_target / wob - 1.0) * 0.7;
        } else if (torque_per_wob > 0.7) {
            wob_target = wob * 0.85;
            wob_gain = -0.05;
        }
    }
    if (efficiency < kLowEfficiency && rpm > 0.0) {
        if (torque > 0.8 * params_.max_torque_kftlbs) {
            rpm_target = rpm * 0.85;
            rpm_gain = -0.03;
        } else if (torque < 0.4 * params_.max_torque_kftlbs) {
            rpm_target = rpm * 1.15;
            rpm_gain = (rpm_target / rpm - 1.0) * 0.5;
        }
    }
    if (f.hole_cleaning_index < 0.7 && flow > 0.0) {
        flow_target = flow * 1.15;
        flow_gain = 0.05;
    }

    double improvement = (1.0 + wob_gain) * (1.0 + rpm_gain) * (1.0 + flow_gain) - 1.0;

    // Recommend only part of the theoretical move.
    double step = 0.5 + 0.5 * params_.aggressiveness;
    wob_target = wob + (wob_target - wob) * step;
    rpm_target = rpm + (rpm_target - rpm) * step;
    flow_target = flow + (flow_target - flow) * step;

    double setpoint_change = 0.0;
    if (wob > 0.0) setpoint_change = std::max(setpoint_change, std::fabs(wob_target / wob - 1.0));
    if (rpm > 0.0) setpoint_change = std::max(setpoint_change, std::fabs(rpm_target / rpm - 1.0));
    if (flow > 0.0) setpoint_change = std::max(setpoint_change, std::fabs(flow_target / flow - 1.0));

    if (efficiency < kLowEfficiency) {
        addFactor(e, "Low Drilling Efficiency", efficiency, "ratio",
            mse > optimal_mse * 1.5
                ? "Adjust parameters to reduce MSE and improve drilling efficiency"
                : nullptr);
    }
    if (wob_target != wob) {
        const char* verb = wob_target > wob ? "Gradually increase" : "Gradually decrease";
        addFactor(e, "WOB Adjustment", wob_target, "klbs", nullptr);
        e.recommendations.push_back(setpointText(verb, "WOB", wob_target, 1, "klbs"));
    }
    if (rpm_target != rpm) {
        const char* verb = rpm_target > rpm ? "Gradually increase" : "Gradually decrease";
        addFactor(e, "RPM Adjustment", rpm_target, "rpm", nullptr);
        e.recommendations.push_back(setpointText(verb, "RPM", rpm_target, 0, ""));
    }
    if (flow_target != flow) {
        addFactor(e, "Flow Rate Adjustment", flow_target, "gpm", nullptr);
        e.recommendations.push_back(
            setpointText("Increase", "flow rate", flow_target, 0, "gpm") +
            " for better hole cleaning");
    }

    e.features["efficiency"] = efficiency;
    e.features["recommended_wob_klbs"] = wob_target;
    e.features["recommended_rpm"] = rpm_target;
    e.features["recommended_flow_gpm"] = flow_target;
    e.features["expected_rop_improvement"] = improvement * rop;

    e.residuals["expected_rop"] = rop * (1.0 + improvement);
    e.residuals["setpoint_change"] = setpoint_change;
    e.residuals["implied_bit_wear"] = 1.0 - efficiency;
    attachPhysicsResiduals(f, e);

    out.score = applySensitivity(1.0 - efficiency, state.sensitivity);
    return out;
}

} // namespace rigsense

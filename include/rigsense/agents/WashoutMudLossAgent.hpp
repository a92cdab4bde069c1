#pragma once

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

// Washout of the string versus losses to the formation. Both hypotheses
// are scored; the stronger one names the issue.
// weights: {spp_drop, flow_pressure_anomaly, torque_instability,
//           flow_loss, pressure_flow_correlation, ecd}
class WashoutMudLossAgent : public AgentAdapter {
public:
    explicit WashoutMudLossAgent(double sensitivity = 0.8);

    static AgentModelState defaultState(double sensitivity = 0.8);

protected:
    std::vector<Channel> requiredChannels() const override;

    Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const override;
};

} // namespace rigsense

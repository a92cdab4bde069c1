#pragma once

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

// Mechanical sticking from drag, torque excursions and rotary instability.
// weights: {drag, torque_risk, torque_instability, rpm_instability}
class MechanicalStickingAgent : public AgentAdapter {
public:
    explicit MechanicalStickingAgent(double sensitivity = 0.8);

    static AgentModelState defaultState(double sensitivity = 0.8);

protected:
    std::vector<Channel> requiredChannels() const override;

    Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const override;
};

} // namespace rigsense

#pragma once

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

// Differential sticking: overbalance against the formation, ECD,
// poor filter-cake management and stationary pipe.
// weights: {overbalance, ecd, low_flow, stationary}
class DifferentialStickingAgent : public AgentAdapter {
public:
    explicit DifferentialStickingAgent(double sensitivity = 0.7);

    static AgentModelState defaultState(double sensitivity = 0.7);

protected:
    std::vector<Channel> requiredChannels() const override;

    Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const override;
};

} // namespace rigsense

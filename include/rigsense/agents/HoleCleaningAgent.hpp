#pragma once

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

// Cuttings-transport adequacy.
// weights: {cleaning_index, rop, rpm, flow, ecd, hole_angle}
class HoleCleaningAgent : public AgentAdapter {
public:
    explicit HoleCleaningAgent(double sensitivity = 0.75);

    static AgentModelState defaultState(double sensitivity = 0.75);

protected:
    std::vector<Channel> requiredChannels() const override;

    Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const override;
};

} // namespace rigsense

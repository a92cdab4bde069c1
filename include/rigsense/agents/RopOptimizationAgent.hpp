#pragma once

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

struct RopParams {
    double aggressiveness = 0.3;   // fraction of the theoretical set-point move to recommend
    double ucs_psi = 20000.0;      // unconfined compressive strength of the formation
    double max_torque_kftlbs = 100.0;
};

// Drilling-efficiency agent. Efficiency = (0.35 UCS) / MSE; the score is
// the inefficiency, so a poorly transferring bit votes high. Evidence
// carries the recommended WOB/RPM/flow set points.
class RopOptimizationAgent : public AgentAdapter {
public:
    explicit RopOptimizationAgent(double sensitivity = 0.5, RopParams params = RopParams());

    static AgentModelState defaultState(double sensitivity = 0.5);

    const RopParams& params() const { return params_; }

protected:
    std::vector<Channel> requiredChannels() const override;

    Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const override;

private:
    RopParams params_;
};

} // namespace rigsense

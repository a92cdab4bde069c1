#include "rigsense/config/EngineConfig.hpp"

namespace rigsense {

EngineConfig EngineConfig::defaults() {
    EngineConfig cfg;

    auto stock = [&cfg](const char* name, double sensitivity) {
        AgentSettings s;
        s.sensitivity = sensitivity;
        cfg.agents[name] = s;
    };
    stock(agent_names::kMechanicalSticking, 0.8);
    stock(agent_names::kDifferentialSticking, 0.7);
    stock(agent_names::kHoleCleaning, 0.75);
    stock(agent_names::kWashoutMudLoss, 0.8);
    stock(agent_names::kRopOptimization, 0.5);

    cfg.simulation.window_ms = cfg.cycle_interval_ms;
    return cfg;
}

} // namespace rigsense

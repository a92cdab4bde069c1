#include "rigsense/agents/DefaultAgents.hpp"
#include "rigsense/agents/DifferentialStickingAgent.hpp"
#include "rigsense/agents/HoleCleaningAgent.hpp"
#include "rigsense/agents/MechanicalStickingAgent.hpp"
#include "rigsense/agents/RopOptimizationAgent.hpp"
#include "rigsense/agents/WashoutMudLossAgent.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace rigsense {

namespace {

const AgentSettings* enabled(const EngineConfig& cfg, const char* name) {
    auto it = cfg.agents.find(name);
    if (it == cfg.agents.end() || !it->second.enabled) {
        std::cout << "[AGENT] " << name << " disabled\n";
        return nullptr;
    }
    return &it->second;
}

} // namespace

AgentRegistry buildAgents(const EngineConfig& cfg) {
    AgentRegistry registry;

    if (const AgentSettings* s = enabled(cfg, agent_names::kMechanicalSticking)) {
        registry.add(std::make_unique<MechanicalStickingAgent>(s->sensitivity));
    }
    if (const AgentSettings* s = enabled(cfg, agent_names::kDifferentialSticking)) {
        registry.add(std::make_unique<DifferentialStickingAgent>(s->sensitivity));
    }
    if (const AgentSettings* s = enabled(cfg, agent_names::kHoleCleaning)) {
        registry.add(std::make_unique<HoleCleaningAgent>(s->sensitivity));
    }
    if (const AgentSettings* s = enabled(cfg, agent_names::kWashoutMudLoss)) {
        registry.add(std::make_unique<WashoutMudLossAgent>(s->sensitivity));
    }
    if (const AgentSettings* s = enabled(cfg, agent_names::kRopOptimization)) {
        registry.add(std::make_unique<RopOptimizationAgent>(s->sensitivity, cfg.rop));
    }
    return registry;
}

bool defaultStateFor(const std::string& name, double sensitivity, AgentModelState& out) {
    if (name == agent_names::kMechanicalSticking) {
        out = MechanicalStickingAgent::defaultState(sensitivity);
    } else if (name == agent_names::kDifferentialSticking) {
        out = DifferentialStickingAgent::defaultState(sensitivity);
    } else if (name == agent_names::kHoleCleaning) {
        out = HoleCleaningAgent::defaultState(sensitivity);
    } else if (name == agent_names::kWashoutMudLoss) {
        out = WashoutMudLossAgent::defaultState(sensitivity);
    } else if (name == agent_names::kRopOptimization) {
        out = RopOptimizationAgent::defaultState(sensitivity);
    } else {
        return false;
    }
    out.agent = name;
    return true;
}

} // namespace rigsense

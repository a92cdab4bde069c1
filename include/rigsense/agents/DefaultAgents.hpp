#pragma once

#include <string>

#include "rigsense/agents/AgentRegistry.hpp"
#include "rigsense/config/EngineConfig.hpp"

namespace rigsense {

// Registers the enabled reference agents with their configured sensitivities.
AgentRegistry buildAgents(const EngineConfig& cfg);

// Starting state the named reference agent would get. False for an unknown name.
bool defaultStateFor(const std::string& name, double sensitivity, AgentModelState& out);

} // namespace rigsense

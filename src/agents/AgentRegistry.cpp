#include "rigsense/agents/AgentRegistry.hpp"
#include "rigsense/core/Errors.hpp"

#include <iostream>

namespace rigsense {

void AgentRegistry::add(std::unique_ptr<AgentAdapter> agent) {
    if (!agent) {
        throw ConfigError("null agent registered");
    }
    if (find(agent->name())) {
        throw ConfigError("duplicate agent name: " + agent->name());
    }
    std::cout << "[AGENT] registered " << agent->name()
              << " category=" << toString(agent->category())
              << " sensitivity=" << agent->modelState()->sensitivity << "\n";
    agents_.push_back(std::move(agent));
}

AgentAdapter* AgentRegistry::find(const std::string& name) const {
    for (const auto& a : agents_) {
        if (a->name() == name) return a.get();
    }
    return nullptr;
}

std::vector<AgentAdapter*> AgentRegistry::agentsFor(Category c) const {
    std::vector<AgentAdapter*> out;
    for (const auto& a : agents_) {
        if (a->category() == c) out.push_back(a.get());
    }
    return out;
}

std::vector<Category> AgentRegistry::categories() const {
    std::vector<Category> out;
    for (Category c : kAllCategories) {
        for (const auto& a : agents_) {
            if (a->category() == c) {
                out.push_back(c);
                break;
            }
        }
    }
    return out;
}

} // namespace rigsense

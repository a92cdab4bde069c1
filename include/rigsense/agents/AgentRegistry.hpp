#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rigsense/agents/AgentAdapter.hpp"

namespace rigsense {

// Owns every adapter for the process lifetime. One name, one adapter,
// one model state.
class AgentRegistry {
public:
    AgentRegistry() = default;
    AgentRegistry(AgentRegistry&&) = default;
    AgentRegistry& operator=(AgentRegistry&&) = default;

    // Throws ConfigError on a duplicate name.
    void add(std::unique_ptr<AgentAdapter> agent);

    AgentAdapter* find(const std::string& name) const;

    const std::vector<std::unique_ptr<AgentAdapter>>& all() const { return agents_; }
    std::vector<AgentAdapter*> agentsFor(Category c) const;

    // Categories served by at least one agent, in priority order.
    std::vector<Category> categories() const;

    size_t size() const { return agents_.size(); }
    bool empty() const { return agents_.empty(); }

private:
    std::vector<std::unique_ptr<AgentAdapter>> agents_;
};

} // namespace rigsense

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rigsense {

// Mutable parameter set of one agent. Never mutated in place once
// published: the adaptation path builds a new value and swaps it in.
struct AgentModelState {
    std::string agent;
    uint64_t version = 0;
    double sensitivity = 0.5;
    double reliability = 0.8;
    double bias = 0.0;
    std::vector<double> weights;

    bool operator==(const AgentModelState& o) const {
        return agent == o.agent &&
               version == o.version &&
               sensitivity == o.sensitivity &&
               reliability == o.reliability &&
               bias == o.bias &&
               weights == o.weights;
    }
    bool operator!=(const AgentModelState& o) const { return !(*this == o); }
};

using ModelSnapshot = std::shared_ptr<const AgentModelState>;

// ---------------------------------------------------------------------------
// Single-slot snapshot holder.
//
// Readers call snapshot() once per predict() and keep the returned pointer
// for the whole call; a concurrent publish() swaps the slot but never
// touches the object a reader holds. No lock spans both paths.
// ---------------------------------------------------------------------------
class ModelStateCell {
public:
    explicit ModelStateCell(AgentModelState initial)
        : state_(std::make_shared<const AgentModelState>(std::move(initial))) {}

    ModelSnapshot snapshot() const {
        return std::atomic_load(&state_);
    }

    void publish(ModelSnapshot next) {
        std::atomic_store(&state_, std::move(next));
    }

private:
    ModelSnapshot state_;
};

} // namespace rigsense

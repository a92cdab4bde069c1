#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rigsense {

enum class AgentFault : uint8_t {
    AgentUnavailable = 1,
    InvalidWindow = 2
};

inline const char* toString(AgentFault f) {
    switch (f) {
        case AgentFault::AgentUnavailable: return "AgentUnavailable";
        case AgentFault::InvalidWindow:    return "InvalidWindow";
    }
    return "Unknown";
}

// Thrown by adapters. Recovered locally by the cycle: the agent simply
// contributes no vote this cycle.
class AgentError : public std::runtime_error {
public:
    AgentError(AgentFault fault, const std::string& what)
        : std::runtime_error(what), fault_(fault) {}

    AgentFault fault() const noexcept { return fault_; }

private:
    AgentFault fault_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace rigsense

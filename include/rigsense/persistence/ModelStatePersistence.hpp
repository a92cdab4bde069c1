#pragma once

#include <string>

#include "rigsense/agents/AgentRegistry.hpp"
#include "rigsense/physics/ConstraintChecker.hpp"

namespace rigsense {

// Saves and restores every agent's model state as JSON, keyed by well id.
// States recorded for another well are never installed.
class ModelStatePersistence {
public:
    ModelStatePersistence(
        std::string path,
        std::string well_id
    );

    // Throws std::runtime_error when the file cannot be written.
    void save(const AgentRegistry& registry) const;

    // Installs each stored state that passes the bound check. Returns how
    // many were installed; a missing file installs nothing. Throws
    // std::runtime_error on a malformed file.
    size_t load(
        AgentRegistry& registry,
        const ConstraintChecker& checker
    ) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string well_id_;
};

} // namespace rigsense

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "rigsense/adaptation/AdaptationController.hpp"
#include "rigsense/agents/RopOptimizationAgent.hpp"
#include "rigsense/alerts/AlertBook.hpp"
#include "rigsense/alerts/AlertPublisher.hpp"
#include "rigsense/consensus/ConsensusAggregator.hpp"
#include "rigsense/physics/ConstraintChecker.hpp"
#include "rigsense/telemetry/SimulatedFeed.hpp"

namespace rigsense {

struct AgentSettings {
    bool enabled = true;
    double sensitivity = 0.5;
    AdaptationPolicy adaptation;
};

struct SinkSettings {
    bool log = true;
    std::string journal_path = "rigsense_alerts.jsonl";   // empty disables
    std::string webhook_url;                              // empty disables
    std::string webhook_secret;
    long webhook_timeout_sec = 3;
};

struct HttpSettings {
    bool enabled = true;
    std::string address = "0.0.0.0";
    uint16_t port = 8088;
};

struct EngineConfig {
    std::string well_id = "WELL-001";

    uint64_t cycle_interval_ms = 5000;
    uint64_t cycle_deadline_ms = 2000;
    size_t worker_threads = 4;

    ConsensusPolicy consensus;
    PhysicsLimits physics;
    AlertBookPolicy alerts;
    PublisherPolicy publisher;
    SinkSettings sinks;
    HttpSettings http;

    // Keyed by agent name.
    std::map<std::string, AgentSettings> agents;
    RopParams rop;

    std::string state_path = "rigsense_state.json";   // empty disables
    SimulationConfig simulation;

    // Reference agents enabled with their stock sensitivities.
    static EngineConfig defaults();
};

} // namespace rigsense

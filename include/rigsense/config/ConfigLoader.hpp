#pragma once

#include <string>

#include "rigsense/config/EngineConfig.hpp"

namespace rigsense {

// ---------------------------------------------------------------------------
// JSON configuration. Absent keys keep their defaults; present keys must
// have the right type. Every entry point validates before returning and
// throws ConfigError on the first problem.
//
//   { "well_id": "...",
//     "cycle":      { "interval_ms", "deadline_ms", "workers" },
//     "consensus":  { "thresholds": { "<category>": x }, "corroboration_window_cycles",
//                     "recency_decay", "min_signals" },
//     "agents":     { "<agent>": { "enabled", "sensitivity", "adaptation_step",
//                                  "divergence_trip", "aggressiveness", "ucs_psi" } },
//     "physics":    { "<limit>": x },
//     "alerts":     { "expiry_ms", "history_limit", "max_delivery_attempts", "retry_interval_ms",
//                     "log", "journal_path", "webhook_url", "webhook_secret" },
//     "http":       { "enabled", "address", "port" },
//     "state_path": "...",
//     "simulation": { "enabled", "seed", "samples_per_window", "window_ms",
//                     "scenario", "scenario_start_window", "max_windows" } }
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    static EngineConfig loadFile(const std::string& path);
    static EngineConfig parse(const std::string& text);

    static void validate(const EngineConfig& cfg);

    // Secrets masked.
    static void dump(const EngineConfig& cfg);
};

} // namespace rigsense

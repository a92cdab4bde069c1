#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "rigsense/core/Types.hpp"
#include "rigsense/telemetry/TelemetryWindow.hpp"

namespace rigsense {

struct EvidenceFactor {
    std::string name;
    double value = 0.0;
    std::string unit;
};

// Structured justification attached to a prediction.
// Residual keys checked by the physics checker:
//   mass_balance, hydraulic, mse_psi, implied_bit_wear,
//   setpoint_change, expected_rop, hole_cleaning_index
struct Evidence {
    std::vector<EvidenceFactor> factors;
    std::map<std::string, double> residuals;
    std::map<std::string, double> features;
    std::vector<std::string> recommendations;
    std::string issue;
};

struct WindowRef {
    uint64_t sequence = 0;
    uint64_t end_ms = 0;
};

// Immutable value object. Construction requires the source window.
class Prediction {
public:
    Prediction(
        const TelemetryWindow& window,
        std::string agent,
        Category category,
        double score,
        double confidence,
        Evidence evidence,
        uint64_t model_version,
        uint64_t produced_ms
    );

    const std::string& agent() const { return agent_; }
    Category category() const { return category_; }
    double score() const { return score_; }
    double confidence() const { return confidence_; }
    const Evidence& evidence() const { return evidence_; }
    const WindowRef& window() const { return window_; }
    uint64_t modelVersion() const { return model_version_; }
    uint64_t producedMs() const { return produced_ms_; }

private:
    std::string agent_;
    Category category_;
    double score_;
    double confidence_;
    Evidence evidence_;
    WindowRef window_;
    uint64_t model_version_;
    uint64_t produced_ms_;
};

} // namespace rigsense

#include "rigsense/core/Prediction.hpp"

#include <utility>

namespace rigsense {

Prediction::Prediction(
    const TelemetryWindow& window,
    std::string agent,
    Category category,
    double score,
    double confidence,
    Evidence evidence,
    uint64_t model_version,
    uint64_t produced_ms
) : agent_(std::move(agent)),
    category_(category),
    score_(score),
    confidence_(confidence),
    evidence_(std::move(evidence)),
    window_{window.sequence(), window.endMs()},
    model_version_(model_version),
    produced_ms_(produced_ms) {}

} // namespace rigsense

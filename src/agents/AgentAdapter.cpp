#include "rigsense/agents/AgentAdapter.hpp"
#include "rigsense/core/Clock.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rigsense {

AgentAdapter::AgentAdapter(
    std::string name,
    Category category,
    AgentModelState defaults
) : name_(std::move(name)),
    category_(category),
    defaults_(defaults),
    cell_(std::move(defaults)) {
    defaults_.agent = name_;
    AgentModelState initial = defaults_;
    cell_.publish(std::make_shared<const AgentModelState>(std::move(initial)));
}

double AgentAdapter::applySensitivity(double p, double sensitivity) {
    return std::min(1.0, p * (1.0 + (sensitivity - 0.5)));
}

double AgentAdapter::weight(const AgentModelState& s, size_t i, double fallback) {
    return i < s.weights.size() ? s.weights[i] : fallback;
}

void AgentAdapter::attachPhysicsResiduals(const WindowFeatures& f, Evidence& e) {
    e.residuals["hydraulic"] = f.hydraulic_residual;
    e.residuals["mse_psi"] = f.mse_psi;
    if (f.hasFlowOut()) {
        e.residuals["mass_balance"] = f.mass_balance_residual;
    }
    e.features["drag_factor"] = f.drag_factor;
    e.features["differential_pressure_psi"] = f.differential_pressure_psi;
    e.features["hole_cleaning_index"] = f.hole_cleaning_index;
    e.features["coverage"] = f.coverage;
}

void AgentAdapter::addFactor(
    Evidence& e,
    const char* name,
    double value,
    const char* unit,
    const char* recommendation
) {
    e.factors.push_back(EvidenceFactor{name, value, unit});
    if (recommendation) {
        e.recommendations.emplace_back(recommendation);
    }
}

Prediction AgentAdapter::predict(const TelemetryWindow& window) const {
    ModelSnapshot state = cell_.snapshot();

    WindowFeatures features = WindowFeatures::compute(window, requiredChannels());
    Inference inf = infer(features, *state);

    double score = inf.score + state->bias;
    if (std::isfinite(score)) {
        score = std::min(1.0, std::max(0.0, score));
    }
    double confidence = std::min(1.0, std::max(0.0,
        state->reliability * features.coverage));

    return Prediction(
        window,
        name_,
        category_,
        score,
        confidence,
        std::move(inf.evidence),
        state->version,
        infra::wall_ms()
    );
}

} // namespace rigsense

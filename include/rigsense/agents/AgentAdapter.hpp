#pragma once

#include <string>
#include <vector>

#include "rigsense/agents/AgentModelState.hpp"
#include "rigsense/core/Prediction.hpp"
#include "rigsense/telemetry/WindowFeatures.hpp"

namespace rigsense {

class AdaptationController;

struct Inference {
    double score = 0.0;
    Evidence evidence;
};

// ---------------------------------------------------------------------------
// Uniform contract around one agent's inference.
//
// predict() takes one model snapshot at entry and uses it for the whole
// call, so an adaptation swap during the call is never observed halfway.
// Throws AgentError(InvalidWindow) when a required channel is missing and
// AgentError(AgentUnavailable) when the backing model cannot answer.
//
// Subclasses implement infer() only; they never see the mutable cell.
// ---------------------------------------------------------------------------
class AgentAdapter {
public:
    AgentAdapter(
        std::string name,
        Category category,
        AgentModelState defaults
    );
    virtual ~AgentAdapter() = default;

    AgentAdapter(const AgentAdapter&) = delete;
    AgentAdapter& operator=(const AgentAdapter&) = delete;

    const std::string& name() const { return name_; }
    Category category() const { return category_; }

    Prediction predict(const TelemetryWindow& window) const;

    ModelSnapshot modelState() const { return cell_.snapshot(); }

    // Physics-derived starting point; what recalibration resets to.
    const AgentModelState& defaults() const { return defaults_; }

protected:
    virtual std::vector<Channel> requiredChannels() const = 0;

    virtual Inference infer(
        const WindowFeatures& features,
        const AgentModelState& state
    ) const = 0;

    // p * (1 + (sensitivity - 0.5)), capped at 1.
    static double applySensitivity(double p, double sensitivity);

    static double weight(const AgentModelState& s, size_t i, double fallback);

    // Mass, hydraulic and energy residuals every physics check can use.
    static void attachPhysicsResiduals(const WindowFeatures& f, Evidence& e);

    static void addFactor(
        Evidence& e,
        const char* name,
        double value,
        const char* unit,
        const char* recommendation
    );

private:
    friend class AdaptationController;
    friend class ModelStatePersistence;

    // Only the adaptation path and state restore swap snapshots.
    void install(ModelSnapshot next) { cell_.publish(std::move(next)); }

    std::string name_;
    Category category_;
    AgentModelState defaults_;
    ModelStateCell cell_;
};

} // namespace rigsense

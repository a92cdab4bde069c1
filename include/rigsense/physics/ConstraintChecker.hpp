#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "rigsense/agents/AgentModelState.hpp"
#include "rigsense/core/Prediction.hpp"

namespace rigsense {

enum class Violation : uint8_t {
    None = 0,
    NonFinite,
    ScoreOutOfRange,
    ConfidenceOutOfRange,
    MissingWindow,
    MassBalance,
    HydraulicResidual,
    EnergyBound,
    NegativeBitWear,
    RateLimit,
    IndexOutOfRange,
    ParameterOutOfBounds,
    StepTooLarge,
    IdentityMismatch
};

const char* toString(Violation v);

struct ConstraintVerdict {
    bool passed = true;
    Violation code = Violation::None;
    std::string reason;

    static ConstraintVerdict ok() { return {}; }
    static ConstraintVerdict fail(Violation code, std::string reason) {
        return {false, code, std::move(reason)};
    }

    explicit operator bool() const { return passed; }
};

struct PhysicsLimits {
    // Prediction residual bounds
    double max_mass_gain = 0.5;           // returns may exceed pump rate by at most 50%
    double max_hydraulic_residual = 0.6;  // |SPP / SPP(Q^1.8) - 1|
    double max_mse_psi = 1.0e6;
    double max_setpoint_change = 0.5;     // recommended set point vs current
    double max_rop_fthr = 500.0;

    // Model parameter bounds
    double min_sensitivity = 0.05;
    double max_sensitivity = 1.0;
    double min_reliability = 0.05;
    double max_reliability = 1.0;
    double max_abs_bias = 0.2;
    double max_weight = 1.0;
    double min_weight_sum = 0.5;
    double max_weight_sum = 1.5;
    double max_step = 0.2;                // per-parameter change per update
};

// ---------------------------------------------------------------------------
// Stateless validator. Every prediction passes through check(prediction)
// before voting; every adaptation candidate through check(current, proposed)
// before it is swapped in.
// ---------------------------------------------------------------------------
class ConstraintChecker {
public:
    explicit ConstraintChecker(PhysicsLimits limits = PhysicsLimits());

    ConstraintVerdict check(const Prediction& prediction) const;

    ConstraintVerdict check(
        const AgentModelState& current,
        const AgentModelState& proposed
    ) const;

    // Bounds only, no step or version rule. Used for persisted states.
    ConstraintVerdict checkBounds(const AgentModelState& state) const;

    const PhysicsLimits& limits() const { return limits_; }

private:
    PhysicsLimits limits_;
};

} // namespace rigsense

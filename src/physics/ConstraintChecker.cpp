#include "rigsense/physics/ConstraintChecker.hpp"

#include <cmath>
#include <sstream>

namespace rigsense {

const char* toString(Violation v) {
    switch (v) {
        case Violation::None:                 return "NONE";
        case Violation::NonFinite:            return "NON_FINITE";
        case Violation::ScoreOutOfRange:      return "SCORE_OUT_OF_RANGE";
        case Violation::ConfidenceOutOfRange: return "CONFIDENCE_OUT_OF_RANGE";
        case Violation::MissingWindow:        return "MISSING_WINDOW";
        case Violation::MassBalance:          return "MASS_BALANCE";
        case Violation::HydraulicResidual:    return "HYDRAULIC_RESIDUAL";
        case Violation::EnergyBound:          return "ENERGY_BOUND";
        case Violation::NegativeBitWear:      return "NEGATIVE_BIT_WEAR";
        case Violation::RateLimit:            return "RATE_LIMIT";
        case Violation::IndexOutOfRange:      return "INDEX_OUT_OF_RANGE";
        case Violation::ParameterOutOfBounds: return "PARAMETER_OUT_OF_BOUNDS";
        case Violation::StepTooLarge:         return "STEP_TOO_LARGE";
        case Violation::IdentityMismatch:     return "IDENTITY_MISMATCH";
    }
    return "UNKNOWN";
}

namespace {

std::string fmt(const char* what, double value, double bound) {
    std::ostringstream os;
    os << what << "=" << value << " bound=" << bound;
    return os.str();
}

bool findResidual(const Evidence& e, const char* key, double& out) {
    auto it = e.residuals.find(key);
    if (it == e.residuals.end()) return false;
    out = it->second;
    return true;
}

} // namespace

ConstraintChecker::ConstraintChecker(PhysicsLimits limits)
    : limits_(limits) {}

ConstraintVerdict ConstraintChecker::check(const Prediction& p) const {
    if (p.window().sequence == 0) {
        return ConstraintVerdict::fail(Violation::MissingWindow,
            "prediction carries no window reference");
    }
    if (!std::isfinite(p.score()) || !std::isfinite(p.confidence())) {
        return ConstraintVerdict::fail(Violation::NonFinite, "score or confidence not finite");
    }
    if (p.score() < 0.0 || p.score() > 1.0) {
        return ConstraintVerdict::fail(Violation::ScoreOutOfRange,
            fmt("score", p.score(), 1.0));
    }
    if (p.confidence() < 0.0 || p.confidence() > 1.0) {
        return ConstraintVerdict::fail(Violation::ConfidenceOutOfRange,
            fmt("confidence", p.confidence(), 1.0));
    }

    const Evidence& e = p.evidence();
    for (const auto& kv : e.residuals) {
        if (!std::isfinite(kv.second)) {
            return ConstraintVerdict::fail(Violation::NonFinite,
                "residual " + kv.first + " not finite");
        }
    }

    double v = 0.0;

    // Mass: cannot lose more than the pump delivers, and returns may only
    // exceed the pump rate by a bounded influx.
    if (findResidual(e, "mass_balance", v)) {
        if (v > 1.0 || v < -limits_.max_mass_gain) {
            return ConstraintVerdict::fail(Violation::MassBalance,
                fmt("mass_balance", v, limits_.max_mass_gain));
        }
    }

    if (findResidual(e, "hydraulic", v)) {
        if (std::fabs(v) > limits_.max_hydraulic_residual) {
            return ConstraintVerdict::fail(Violation::HydraulicResidual,
                fmt("hydraulic", v, limits_.max_hydraulic_residual));
        }
    }

    if (findResidual(e, "mse_psi", v)) {
        if (v < 0.0 || v > limits_.max_mse_psi) {
            return ConstraintVerdict::fail(Violation::EnergyBound,
                fmt("mse_psi", v, limits_.max_mse_psi));
        }
    }

    if (findResidual(e, "implied_bit_wear", v)) {
        if (v < 0.0) {
            return ConstraintVerdict::fail(Violation::NegativeBitWear,
                fmt("implied_bit_wear", v, 0.0));
        }
    }

    if (findResidual(e, "setpoint_change", v)) {
        if (std::fabs(v) > limits_.max_setpoint_change) {
            return ConstraintVerdict::fail(Violation::RateLimit,
                fmt("setpoint_change", v, limits_.max_setpoint_change));
        }
    }

    if (findResidual(e, "expected_rop", v)) {
        if (v < 0.0 || v > limits_.max_rop_fthr) {
            return ConstraintVerdict::fail(Violation::RateLimit,
                fmt("expected_rop", v, limits_.max_rop_fthr));
        }
    }

    if (findResidual(e, "hole_cleaning_index", v)) {
        if (v < 0.0 || v > 1.0) {
            return ConstraintVerdict::fail(Violation::IndexOutOfRange,
                fmt("hole_cleaning_index", v, 1.0));
        }
    }

    return ConstraintVerdict::ok();
}

ConstraintVerdict ConstraintChecker::checkBounds(const AgentModelState& s) const {
    if (!std::isfinite(s.sensitivity) || !std::isfinite(s.reliability) ||
        !std::isfinite(s.bias)) {
        return ConstraintVerdict::fail(Violation::NonFinite, "parameter not finite");
    }
    if (s.sensitivity < limits_.min_sensitivity || s.sensitivity > limits_.max_sensitivity) {
        return ConstraintVerdict::fail(Violation::ParameterOutOfBounds,
            fmt("sensitivity", s.sensitivity, limits_.max_sensitivity));
    }
    if (s.reliability < limits_.min_reliability || s.reliability > limits_.max_reliability) {
        return ConstraintVerdict::fail(Violation::ParameterOutOfBounds,
            fmt("reliability", s.reliability, limits_.min_reliability));
    }
    if (std::fabs(s.bias) > limits_.max_abs_bias) {
        return ConstraintVerdict::fail(Violation::ParameterOutOfBounds,
            fmt("bias", s.bias, limits_.max_abs_bias));
    }

    double sum = 0.0;
    for (double w : s.weights) {
        if (!std::isfinite(w)) {
            return ConstraintVerdict::fail(Violation::NonFinite, "weight not finite");
        }
        if (w < 0.0 || w > limits_.max_weight) {
            return ConstraintVerdict::fail(Violation::ParameterOutOfBounds,
                fmt("weight", w, limits_.max_weight));
        }
        sum += w;
    }
    if (!s.weights.empty() &&
        (sum < limits_.min_weight_sum || sum > limits_.max_weight_sum)) {
        return ConstraintVerdict::fail(Violation::ParameterOutOfBounds,
            fmt("weight_sum", sum, limits_.max_weight_sum));
    }
    return ConstraintVerdict::ok();
}

ConstraintVerdict ConstraintChecker::check(
    const AgentModelState& current,
    const AgentModelState& proposed
) const {
    if (proposed.agent != current.agent) {
        return ConstraintVerdict::fail(Violation::IdentityMismatch,
            "proposed state for " + proposed.agent + " applied to " + current.agent);
    }
    if (proposed.version != current.version + 1) {
        return ConstraintVerdict::fail(Violation::IdentityMismatch,
            "stale update: version " + std::to_string(proposed.version) +
            " over " + std::to_string(current.version));
    }
    if (proposed.weights.size() != current.weights.size()) {
        return ConstraintVerdict::fail(Violation::IdentityMismatch, "weight vector resized");
    }

    ConstraintVerdict bounds = checkBounds(proposed);
    if (!bounds) return bounds;

    auto stepOk = [this](double a, double b) {
        return std::fabs(a - b) <= limits_.max_step;
    };
    if (!stepOk(current.sensitivity, proposed.sensitivity)) {
        return ConstraintVerdict::fail(Violation::StepTooLarge,
            fmt("sensitivity_step", proposed.sensitivity - current.sensitivity, limits_.max_step));
    }
    if (!stepOk(current.reliability, proposed.reliability)) {
        return ConstraintVerdict::fail(Violation::StepTooLarge,
            fmt("reliability_step", proposed.reliability - current.reliability, limits_.max_step));
    }
    if (!stepOk(current.bias, proposed.bias)) {
        return ConstraintVerdict::fail(Violation::StepTooLarge,
            fmt("bias_step", proposed.bias - current.bias, limits_.max_step));
    }
    for (size_t i = 0; i < current.weights.size(); ++i) {
        if (!stepOk(current.weights[i], proposed.weights[i])) {
            return ConstraintVerdict::fail(Violation::StepTooLarge,
                fmt("weight_step", proposed.weights[i] - current.weights[i], limits_.max_step));
        }
    }
    return ConstraintVerdict::ok();
}

} // namespace rigsense

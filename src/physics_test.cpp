// =============================================================================
// src/physics_test.cpp - Physics constraint checker tests
// =============================================================================

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>

#include "rigsense/physics/ConstraintChecker.hpp"
#include "testing/ScriptedAgent.hpp"

using namespace rigsense;
using rigsense::testing::makeWindow;

class PhysicsTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           PHYSICS CONSTRAINT CHECKER - UNIT TESTS                ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_clean_prediction_passes();
        test_score_bounds();
        test_mass_balance();
        test_hydraulic_residual();
        test_negative_bit_wear();
        test_setpoint_rate_limit();
        test_model_bounds();
        test_model_step_limit();
        test_model_version_and_identity();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    ConstraintChecker checker_;
    WindowPtr window_ = makeWindow(7, 5000);
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    Prediction prediction(double score, const Evidence& e = Evidence()) {
        return Prediction(*window_, "checked", Category::Sticking, score, 0.9, e, 1, 0);
    }

    Prediction withResidual(const char* key, double value) {
        Evidence e;
        e.residuals[key] = value;
        return prediction(0.5, e);
    }

    static AgentModelState state() {
        AgentModelState s;
        s.agent = "checked";
        s.version = 4;
        s.sensitivity = 0.7;
        s.reliability = 0.8;
        s.bias = 0.0;
        s.weights = {0.4, 0.3, 0.2, 0.1};
        return s;
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_clean_prediction_passes() {
        std::cout << "TEST: Clean prediction\n";
        Evidence e;
        e.residuals["mass_balance"] = 0.005;
        e.residuals["hydraulic"] = 0.02;
        e.residuals["mse_psi"] = 6500.0;
        e.residuals["hole_cleaning_index"] = 0.81;

        ConstraintVerdict v = checker_.check(prediction(0.72, e));
        if (v) test_pass("plausible residuals pass");
        else test_fail("plausible residuals pass", v.reason);
    }

    void test_score_bounds() {
        std::cout << "\nTEST: Score bounds\n";
        ConstraintVerdict v = checker_.check(prediction(1.2));
        if (!v && v.code == Violation::ScoreOutOfRange) test_pass("score above 1 rejected");
        else test_fail("score above 1 rejected", toString(v.code));

        v = checker_.check(prediction(std::numeric_limits<double>::quiet_NaN()));
        if (!v && v.code == Violation::NonFinite) test_pass("NaN score rejected");
        else test_fail("NaN score rejected", toString(v.code));

        v = checker_.check(withResidual("hydraulic", std::numeric_limits<double>::infinity()));
        if (!v && v.code == Violation::NonFinite) test_pass("infinite residual rejected");
        else test_fail("infinite residual rejected", toString(v.code));
    }

    void test_mass_balance() {
        std::cout << "\nTEST: Mass balance\n";
        ConstraintVerdict v = checker_.check(withResidual("mass_balance", 1.3));
        if (!v && v.code == Violation::MassBalance) test_pass("loss beyond pump rate rejected");
        else test_fail("loss beyond pump rate rejected", toString(v.code));

        v = checker_.check(withResidual("mass_balance", -0.8));
        if (!v && v.code == Violation::MassBalance) test_pass("returns far above pump rate rejected");
        else test_fail("returns far above pump rate rejected", toString(v.code));

        v = checker_.check(withResidual("mass_balance", 0.4));
        if (v) test_pass("partial losses accepted");
        else test_fail("partial losses accepted", v.reason);
    }

    void test_hydraulic_residual() {
        std::cout << "\nTEST: Hydraulic residual\n";
        ConstraintVerdict v = checker_.check(withResidual("hydraulic", -0.75));
        if (!v && v.code == Violation::HydraulicResidual) test_pass("pressure off the Q^1.8 curve rejected");
        else test_fail("pressure off the Q^1.8 curve rejected", toString(v.code));
    }

    void test_negative_bit_wear() {
        std::cout << "\nTEST: Bit wear\n";
        ConstraintVerdict v = checker_.check(withResidual("implied_bit_wear", -0.1));
        if (!v && v.code == Violation::NegativeBitWear) test_pass("negative bit wear rejected");
        else test_fail("negative bit wear rejected", toString(v.code));
    }

    void test_setpoint_rate_limit() {
        std::cout << "\nTEST: Rate limits\n";
        ConstraintVerdict v = checker_.check(withResidual("setpoint_change", 0.6));
        if (!v && v.code == Violation::RateLimit) test_pass("60% set-point jump rejected");
        else test_fail("60% set-point jump rejected", toString(v.code));

        v = checker_.check(withResidual("expected_rop", 900.0));
        if (!v && v.code == Violation::RateLimit) test_pass("implausible ROP rejected");
        else test_fail("implausible ROP rejected", toString(v.code));
    }

    void test_model_bounds() {
        std::cout << "\nTEST: Model parameter bounds\n";
        AgentModelState s = state();
        ConstraintVerdict v = checker_.checkBounds(s);
        if (v) test_pass("stock state in bounds");
        else test_fail("stock state in bounds", v.reason);

        s.bias = 0.3;
        v = checker_.checkBounds(s);
        if (!v && v.code == Violation::ParameterOutOfBounds) test_pass("bias beyond 0.2 rejected");
        else test_fail("bias beyond 0.2 rejected", toString(v.code));

        s = state();
        s.weights = {0.9, 0.9, 0.9, 0.9};
        v = checker_.checkBounds(s);
        if (!v && v.code == Violation::ParameterOutOfBounds) test_pass("weight sum beyond 1.5 rejected");
        else test_fail("weight sum beyond 1.5 rejected", toString(v.code));
    }

    void test_model_step_limit() {
        std::cout << "\nTEST: Model step limit\n";
        AgentModelState cur = state();
        AgentModelState next = cur;
        next.version = cur.version + 1;
        next.sensitivity = cur.sensitivity + 0.05;
        next.reliability = cur.reliability - 0.1;

        ConstraintVerdict v = checker_.check(cur, next);
        if (v) test_pass("small step accepted");
        else test_fail("small step accepted", v.reason);

        next.sensitivity = cur.sensitivity - 0.3;
        v = checker_.check(cur, next);
        if (!v && v.code == Violation::StepTooLarge) test_pass("0.3 sensitivity step rejected");
        else test_fail("0.3 sensitivity step rejected", toString(v.code));
    }

    void test_model_version_and_identity() {
        std::cout << "\nTEST: Model identity\n";
        AgentModelState cur = state();
        AgentModelState next = cur;
        next.version = cur.version;
        ConstraintVerdict v = checker_.check(cur, next);
        if (!v && v.code == Violation::IdentityMismatch) test_pass("stale version rejected");
        else test_fail("stale version rejected", toString(v.code));

        next.version = cur.version + 1;
        next.agent = "other";
        v = checker_.check(cur, next);
        if (!v && v.code == Violation::IdentityMismatch) test_pass("foreign agent state rejected");
        else test_fail("foreign agent state rejected", toString(v.code));

        next.agent = cur.agent;
        next.weights.pop_back();
        v = checker_.check(cur, next);
        if (!v && v.code == Violation::IdentityMismatch) test_pass("resized weights rejected");
        else test_fail("resized weights rejected", toString(v.code));
    }

    void print_summary() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                         TEST SUMMARY                             ║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(3) << tests_passed_
                  << "                                                      ║\n";
        std::cout << "║  Failed: " << std::setw(3) << tests_failed_
                  << "                                                      ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }
};

int main() {
    PhysicsTest test;
    return test.run_all_tests();
}

// =============================================================================
// src/persistence_test.cpp - Model state save/restore tests
// =============================================================================

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rigsense/persistence/ModelStatePersistence.hpp"
#include "testing/ScriptedAgent.hpp"

using namespace rigsense;
using rigsense::testing::ScriptedAgent;

namespace {

const char* kWell = "WELL-TEST";

AgentRegistry makeRegistry() {
    AgentRegistry reg;
    reg.add(std::make_unique<ScriptedAgent>("alpha", Category::Sticking, std::vector<double>{0.1}));
    reg.add(std::make_unique<ScriptedAgent>("beta", Category::HoleCleaning, std::vector<double>{0.1}));
    return reg;
}

std::string tempPath(const char* tag) {
    return std::string("/tmp/rigsense_persistence_test_") + tag + ".json";
}

void writeFile(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

std::string stateFile(const std::string& well, const std::string& agents) {
    return "{\"well_id\":\"" + well + "\",\"saved_ms\":1,\"agents\":{" + agents + "}}";
}

} // namespace

class PersistenceTest {
public:
    int run_all_tests() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║           MODEL STATE PERSISTENCE - UNIT TESTS                   ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n\n";

        test_missing_file();
        test_restore_and_resave();
        test_foreign_well();
        test_malformed_file();
        test_rejected_entries();
        test_unwritable_path();

        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;
    ConstraintChecker checker_;

    void test_pass(const char* name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void expect(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else test_fail(name, reason);
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_missing_file() {
        std::cout << "TEST: Missing file\n";
        std::string path = tempPath("missing");
        std::remove(path.c_str());

        AgentRegistry reg = makeRegistry();
        ModelStatePersistence p(path, kWell);
        size_t n = p.load(reg, checker_);
        expect(n == 0, "nothing installed", std::to_string(n));
        expect(*reg.find("alpha")->modelState() == reg.find("alpha")->defaults(),
               "defaults kept", "");
    }

    void test_restore_and_resave() {
        std::cout << "\nTEST: Restore and re-save\n";
        std::string in = tempPath("restore_in");
        std::string out = tempPath("restore_out");
        writeFile(in, stateFile(kWell,
            "\"alpha\":{\"version\":7,\"sensitivity\":0.62,\"reliability\":0.9,"
            "\"bias\":0.06,\"weights\":[]},"
            "\"beta\":{\"version\":3,\"sensitivity\":0.45,\"reliability\":0.7,"
            "\"bias\":-0.025,\"weights\":[]}"));

        AgentRegistry first = makeRegistry();
        size_t n = ModelStatePersistence(in, kWell).load(first, checker_);
        expect(n == 2, "both states installed", std::to_string(n));

        ModelSnapshot a = first.find("alpha")->modelState();
        expect(a->version == 7 && a->sensitivity == 0.62 && a->reliability == 0.9 &&
               a->bias == 0.06 && a->agent == "alpha",
               "restored values match the file", std::to_string(a->sensitivity));

        ModelStatePersistence(out, kWell).save(first);

        AgentRegistry second = makeRegistry();
        n = ModelStatePersistence(out, kWell).load(second, checker_);
        expect(n == 2, "saved file restores", std::to_string(n));
        expect(*second.find("alpha")->modelState() == *first.find("alpha")->modelState() &&
               *second.find("beta")->modelState() == *first.find("beta")->modelState(),
               "state survives a save/load cycle", "");

        std::remove(in.c_str());
        std::remove(out.c_str());
    }

    void test_foreign_well() {
        std::cout << "\nTEST: Foreign well\n";
        std::string path = tempPath("foreign");
        writeFile(path, stateFile("OTHER-WELL",
            "\"alpha\":{\"version\":4,\"sensitivity\":0.9,\"reliability\":0.9,"
            "\"bias\":0.0,\"weights\":[]}"));

        AgentRegistry reg = makeRegistry();
        size_t n = ModelStatePersistence(path, kWell).load(reg, checker_);
        expect(n == 0, "nothing installed", std::to_string(n));
        expect(reg.find("alpha")->modelState()->sensitivity == 0.5,
               "defaults kept", std::to_string(reg.find("alpha")->modelState()->sensitivity));
        std::remove(path.c_str());
    }

    void test_malformed_file() {
        std::cout << "\nTEST: Malformed file\n";
        std::string path = tempPath("malformed");

        const std::vector<std::string> bodies = {
            "{ truncated",
            "[]",
            "{\"well_id\":\"WELL-TEST\"}"
        };
        for (const auto& body : bodies) {
            writeFile(path, body);
            AgentRegistry reg = makeRegistry();
            try {
                ModelStatePersistence(path, kWell).load(reg, checker_);
                test_fail("malformed file throws", body);
            } catch (const std::runtime_error&) {
                test_pass("malformed file throws");
            }
        }
        std::remove(path.c_str());
    }

    void test_rejected_entries() {
        std::cout << "\nTEST: Rejected entries\n";
        std::string path = tempPath("rejected");
        writeFile(path, stateFile(kWell,
            // bias beyond max_abs_bias
            "\"alpha\":{\"version\":2,\"sensitivity\":0.5,\"reliability\":0.9,"
            "\"bias\":0.5,\"weights\":[]},"
            // weight count differs from the agent's defaults
            "\"beta\":{\"version\":2,\"sensitivity\":0.5,\"reliability\":0.9,"
            "\"bias\":0.0,\"weights\":[0.5,0.5]},"
            "\"gamma\":{\"version\":2,\"sensitivity\":0.5,\"reliability\":0.9,"
            "\"bias\":0.0,\"weights\":[]}"));

        AgentRegistry reg = makeRegistry();
        size_t n = ModelStatePersistence(path, kWell).load(reg, checker_);
        expect(n == 0, "out-of-bounds, mismatched and unknown entries skipped", std::to_string(n));
        expect(reg.find("alpha")->modelState()->version == 0 &&
               reg.find("beta")->modelState()->version == 0,
               "registered agents untouched", "");

        writeFile(path, stateFile(kWell,
            "\"alpha\":{\"version\":2,\"sensitivity\":\"high\",\"reliability\":0.9,"
            "\"bias\":0.0,\"weights\":[]},"
            "\"beta\":{\"version\":5,\"sensitivity\":0.55,\"reliability\":0.9,"
            "\"bias\":0.0,\"weights\":[]}"));
        AgentRegistry mixed = makeRegistry();
        n = ModelStatePersistence(path, kWell).load(mixed, checker_);
        expect(n == 1 && mixed.find("beta")->modelState()->version == 5,
               "one bad entry does not block the others", std::to_string(n));
        std::remove(path.c_str());
    }

    void test_unwritable_path() {
        std::cout << "\nTEST: Unwritable path\n";
        AgentRegistry reg = makeRegistry();
        try {
            ModelStatePersistence("/nonexistent/dir/state.json", kWell).save(reg);
            test_fail("save throws", "no error");
        } catch (const std::runtime_error&) {
            test_pass("save throws");
        }
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
    PersistenceTest test;
    return test.run_all_tests();
}

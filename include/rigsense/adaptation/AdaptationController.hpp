#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "rigsense/agents/AgentRegistry.hpp"
#include "rigsense/alerts/AlertBook.hpp"
#include "rigsense/alerts/AlertPublisher.hpp"
#include "rigsense/physics/ConstraintChecker.hpp"

namespace rigsense {

// Missed events carry no alert id; this many event ids are remembered per
// category for replay detection.
constexpr size_t kMissedMemory = 256;

struct AdaptationPolicy {
    double step = 0.05;
    uint32_t divergence_trip = 3;   // consecutive rejected candidates
};

enum class FeedbackResult : uint8_t {
    Applied = 0,
    Duplicate,
    UnknownAlert,
    Suspended,
    Rejected,
    NoOp
};

const char* toString(FeedbackResult r);

// ---------------------------------------------------------------------------
// Online parameter updates from outcomes.
//
// For each agent that supported the alert:
//   err          = target - score     (target 1 Confirmed/Missed, 0 FalsePositive)
//   sensitivity += step * err * 0.5
//   bias        += step * err * 0.25
//   reliability += step * (1 - 2|err|)
//   version     += 1
//
// The candidate is checked against the current snapshot and swapped in only
// when the checker passes. divergence_trip consecutive rejections for one
// agent raise ModelDivergence and suspend that agent's adaptation until
// acknowledgeRecalibration().
//
// Inference never waits on this path: predict() reads whatever snapshot is
// installed when it starts.
// ---------------------------------------------------------------------------
class AdaptationController {
public:
    AdaptationController(
        AgentRegistry& registry,
        AlertBook& book,
        AlertPublisher& publisher,
        const ConstraintChecker& checker,
        AdaptationPolicy defaults = AdaptationPolicy()
    );

    void setPolicy(const std::string& agent, AdaptationPolicy policy);
    AdaptationPolicy policyFor(const std::string& agent) const;

    FeedbackResult apply(const FeedbackEvent& event);

    // Applies every queued event without blocking. Returns events consumed.
    size_t drain(FeedbackStream& stream);

    // Latest accepted predictions per category; Missed feedback targets them.
    void recordPredictions(const std::vector<Prediction>& accepted);

    // Reliability penalty for a prediction the checker refused.
    void penalize(const Prediction& rejected, const ConstraintVerdict& verdict);

    // Lifts suspension and clears the divergence flag. Optionally reinstalls
    // the physics defaults under the next version. False for unknown agents.
    bool acknowledgeRecalibration(const std::string& agent, bool reset_to_defaults);

    bool diverged(const std::string& agent) const;
    uint32_t consecutiveRejections(const std::string& agent) const;

    // Drops event ids of alerts the book no longer holds. Feedback on such
    // an alert is refused as UnknownAlert, so the ids are never needed again.
    // Called by drain(). Returns how many alerts were forgotten.
    size_t forgetRetired();

    size_t trackedAlerts() const;
    size_t trackedMissed(Category c) const;

    uint64_t accepted() const { return accepted_.load(); }
    uint64_t rejected() const { return rejected_.load(); }

private:
    enum class Outcome { Accepted, Rejected, Suspended };

    struct RecentIds {
        std::set<std::string> ids;
        std::deque<std::string> order;

        // False when already seen. Oldest ids fall out past kMissedMemory.
        bool insert(const std::string& id);
    };

    struct Observed {
        std::string agent;
        double score;
    };

    Outcome update(
        AgentAdapter& agent,
        double d_sensitivity,
        double d_bias,
        double d_reliability,
        const char* cause
    );

    AdaptationPolicy policyLocked(const std::string& agent) const;

    FeedbackResult applyOutcome(
        const std::vector<Observed>& observed,
        double target,
        const char* cause
    );

    AgentRegistry& registry_;
    AlertBook& book_;
    AlertPublisher& publisher_;
    const ConstraintChecker& checker_;
    AdaptationPolicy defaults_;

    mutable std::mutex mtx_;
    std::map<std::string, AdaptationPolicy> policies_;
    std::map<std::string, uint32_t> rejections_;
    std::set<std::string> suspended_;
    std::map<uint64_t, std::set<std::string>> applied_;      // alert id -> event ids
    std::map<Category, RecentIds> applied_missed_;
    std::map<Category, std::vector<Observed>> latest_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace rigsense

#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "rigsense/alerts/Alert.hpp"
#include "rigsense/core/Prediction.hpp"
#include "rigsense/core/Types.hpp"

namespace rigsense {

struct ConsensusPolicy {
    // Indexed by Category: sticking, washout/mud loss, hole cleaning, ROP.
    std::array<double, kCategoryCount> thresholds{{0.6, 0.7, 0.65, 0.75}};

    // Cycles a prediction keeps voting, the current one included.
    uint32_t corroboration_window_cycles = 2;
    double recency_decay = 0.5;
    uint32_t min_signals = 2;

    double critical_vote = 0.9;
    double high_vote = 0.8;
    double medium_vote = 0.6;

    double threshold(Category c) const { return thresholds[static_cast<size_t>(c)]; }
    void setThreshold(Category c, double v) { thresholds[static_cast<size_t>(c)] = v; }
};

struct CategoryVote {
    Category category = Category::Sticking;
    double vote = 0.0;
    double threshold = 0.0;

    size_t signals = 0;           // distinct agent/cycle pairs at or above threshold
    size_t current_signals = 0;   // ... of which from this cycle
    size_t current_agents = 0;    // distinct agents among current signals

    bool qualifies = false;
    Severity severity = Severity::Low;

    std::vector<AgentContribution> contributions;
    std::vector<std::string> supporting_agents;

    std::string issue;
    std::string message;
    std::string recommendation;
    std::vector<EvidenceFactor> factors;
};

struct CycleDecision {
    uint64_t cycle = 0;
    WindowRef window;
    std::vector<CategoryVote> votes;    // every category that voted, priority order
    std::vector<CategoryVote> alerts;   // qualifying, by vote desc then priority
};

// ---------------------------------------------------------------------------
// Weighted, corroborated vote per category.
//
//   weight = confidence * decay^age       (age in cycle intervals)
//   vote   = sum(weight * score) / sum(weight)
//
// A category qualifies when vote > threshold, at least min_signals
// agent/cycle pairs scored at or above threshold inside the window, and
// one of them is from the current cycle.
//
// Keeps the retained predictions of earlier cycles; not thread-safe.
// The engine calls aggregate() strictly in cycle order.
// ---------------------------------------------------------------------------
class ConsensusAggregator {
public:
    explicit ConsensusAggregator(ConsensusPolicy policy = ConsensusPolicy());

    // predictions have already passed the constraint checker.
    CycleDecision aggregate(
        uint64_t cycle,
        const WindowRef& window,
        uint64_t interval_ms,
        const std::vector<Prediction>& predictions
    );

    void reset() { retained_.clear(); }
    size_t retainedCount() const { return retained_.size(); }

    const ConsensusPolicy& policy() const { return policy_; }

    Severity deriveSeverity(double vote, size_t current_agents) const;

    static std::string fallbackRecommendation(
        Category c,
        const std::string& top_agent,
        const std::string& issue
    );

private:
    struct Retained {
        uint64_t cycle;
        Prediction prediction;
    };

    uint32_t ageCycles(
        const Retained& r,
        uint64_t cycle,
        const WindowRef& window,
        uint64_t interval_ms
    ) const;

    CategoryVote tally(
        Category c,
        uint64_t cycle,
        const std::vector<const Retained*>& members,
        const std::vector<uint32_t>& ages
    ) const;

    ConsensusPolicy policy_;
    std::deque<Retained> retained_;
};

} // namespace rigsense

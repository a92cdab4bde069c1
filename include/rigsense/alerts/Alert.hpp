#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "rigsense/core/Prediction.hpp"
#include "rigsense/core/Types.hpp"

namespace rigsense {

enum class AlertState : uint8_t {
    Pending = 0,
    Confirmed,
    Dismissed,
    Expired
};

inline const char* toString(AlertState s) {
    switch (s) {
        case AlertState::Pending:   return "PENDING";
        case AlertState::Confirmed: return "CONFIRMED";
        case AlertState::Dismissed: return "DISMISSED";
        case AlertState::Expired:   return "EXPIRED";
    }
    return "UNKNOWN";
}

// One prediction's share of a category vote.
struct AgentContribution {
    std::string agent;
    uint64_t cycle = 0;
    uint32_t age_cycles = 0;
    double score = 0.0;
    double confidence = 0.0;
    double weight = 0.0;
    uint64_t model_version = 0;
    bool supporting = false;   // scored at or above the category threshold
};

struct Alert {
    uint64_t id = 0;
    Category category = Category::Sticking;
    Severity severity = Severity::Low;
    AlertState state = AlertState::Pending;

    double vote = 0.0;
    std::vector<std::string> supporting_agents;
    std::vector<AgentContribution> contributions;

    uint64_t cycle = 0;
    uint64_t window_sequence = 0;
    uint64_t window_ts_ms = 0;

    std::string issue;
    std::string message;
    std::string recommendation;
    std::vector<EvidenceFactor> factors;

    uint32_t refresh_count = 0;
    uint64_t raised_ms = 0;
    uint64_t updated_ms = 0;

    bool terminal() const { return state != AlertState::Pending; }
};

enum class FeedbackKind : uint8_t {
    Confirmed = 0,
    FalsePositive,
    Missed
};

bool parseFeedbackKind(const std::string& text, FeedbackKind& out);

inline const char* toString(FeedbackKind k) {
    switch (k) {
        case FeedbackKind::Confirmed:     return "CONFIRMED";
        case FeedbackKind::FalsePositive: return "FALSE_POSITIVE";
        case FeedbackKind::Missed:        return "MISSED";
    }
    return "UNKNOWN";
}

// Operator or outcome verdict on an alert. alert_id is 0 for Missed,
// which names the category instead.
struct FeedbackEvent {
    std::string event_id;
    uint64_t alert_id = 0;
    FeedbackKind kind = FeedbackKind::Confirmed;
    Category category = Category::Sticking;
    std::string source;
    uint64_t ts_ms = 0;
};

// Coverage and model health as seen by the publisher's collaborators.
struct HealthFlags {
    std::array<bool, kCategoryCount> degraded{};   // indexed by Category
    bool global_degraded = false;
    std::vector<std::string> diverged_agents;

    bool degradedFor(Category c) const { return degraded[static_cast<size_t>(c)]; }
};

} // namespace rigsense

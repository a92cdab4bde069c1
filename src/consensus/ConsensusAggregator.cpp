#include "rigsense/consensus/ConsensusAggregator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

namespace rigsense {

namespace {

const char* defaultIssue(Category c) {
    switch (c) {
        case Category::Sticking:       return "Sticking";
        case Category::WashoutMudLoss: return "Washout/Mud Losses";
        case Category::HoleCleaning:   return "Hole Cleaning";
        case Category::Rop:            return "ROP Optimization";
    }
    return "Unknown";
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

std::string describe(const std::string& issue, double vote, const std::vector<EvidenceFactor>& factors) {
    std::ostringstream os;
    os << issue << " risk detected (" << std::fixed << std::setprecision(1)
       << vote * 100.0 << "%)";
    if (!factors.empty()) {
        os << ". Contributing factors: ";
        for (size_t i = 0; i < factors.size(); ++i) {
            if (i) os << ", ";
            os << factors[i].name << " (" << std::setprecision(2) << factors[i].value;
            if (!factors[i].unit.empty()) os << " " << factors[i].unit;
            os << ")";
        }
    }
    return os.str();
}

} // namespace

ConsensusAggregator::ConsensusAggregator(ConsensusPolicy policy)
    : policy_(policy) {}

Severity ConsensusAggregator::deriveSeverity(double vote, size_t current_agents) const {
    if (vote >= policy_.critical_vote && current_agents >= 2) return Severity::Critical;
    if (vote >= policy_.high_vote) return Severity::High;
    if (vote >= policy_.medium_vote) return Severity::Medium;
    return Severity::Low;
}

std::string ConsensusAggregator::fallbackRecommendation(
    Category c,
    const std::string& top_agent,
    const std::string& issue
) {
    switch (c) {
        case Category::Sticking:
            if (top_agent == agent_names::kDifferentialSticking) {
                return "Monitor ECD and differential pressure";
            }
            return "Monitor drilling parameters closely";
        case Category::WashoutMudLoss:
            return "Monitor drilling parameters for " + lower(issue) + " indicators";
        case Category::HoleCleaning:
            return "Increase flow rate and RPM";
        case Category::Rop:
            return "Maintain current drilling parameters";
    }
    return "Monitor drilling parameters closely";
}

uint32_t ConsensusAggregator::ageCycles(
    const Retained& r,
    uint64_t cycle,
    const WindowRef& window,
    uint64_t interval_ms
) const {
    uint64_t end = r.prediction.window().end_ms;
    if (interval_ms > 0 && window.end_ms >= end) {
        double age = static_cast<double>(window.end_ms - end) /
                     static_cast<double>(interval_ms);
        return static_cast<uint32_t>(std::lround(age));
    }
    return cycle >= r.cycle ? static_cast<uint32_t>(cycle - r.cycle) : 0;
}

CycleDecision ConsensusAggregator::aggregate(
    uint64_t cycle,
    const WindowRef& window,
    uint64_t interval_ms,
    const std::vector<Prediction>& predictions
) {
    for (const auto& p : predictions) {
        retained_.push_back(Retained{cycle, p});
    }

    retained_.erase(
        std::remove_if(retained_.begin(), retained_.end(),
            [&](const Retained& r) {
                return ageCycles(r, cycle, window, interval_ms) >=
                       policy_.corroboration_window_cycles;
            }),
        retained_.end());

    CycleDecision decision;
    decision.cycle = cycle;
    decision.window = window;

    for (Category c : kAllCategories) {
        std::vector<const Retained*> members;
        std::vector<uint32_t> ages;
        for (const auto& r : retained_) {
            if (r.prediction.category() != c) continue;
            members.push_back(&r);
            ages.push_back(ageCycles(r, cycle, window, interval_ms));
        }
        if (members.empty()) continue;

        CategoryVote v = tally(c, cycle, members, ages);
        if (v.qualifies) {
            std::cout << "[CONSENSUS] cycle=" << cycle
                      << " category=" << toString(c)
                      << " vote=" << v.vote
                      << " signals=" << v.signals
                      << " severity=" << toString(v.severity) << "\n";
            decision.alerts.push_back(v);
        }
        decision.votes.push_back(std::move(v));
    }

    std::stable_sort(decision.alerts.begin(), decision.alerts.end(),
        [](const CategoryVote& a, const CategoryVote& b) {
            if (a.vote != b.vote) return a.vote > b.vote;
            return categoryPriority(a.category) < categoryPriority(b.category);
        });

    return decision;
}

CategoryVote ConsensusAggregator::tally(
    Category c,
    uint64_t cycle,
    const std::vector<const Retained*>& members,
    const std::vector<uint32_t>& ages
) const {
    CategoryVote v;
    v.category = c;
    v.threshold = policy_.threshold(c);

    double weight_sum = 0.0;
    double weighted_score = 0.0;
    std::set<std::pair<std::string, uint64_t>> signals;
    std::set<std::string> current_agents;
    std::vector<const Prediction*> supporting;

    for (size_t i = 0; i < members.size(); ++i) {
        const Prediction& p = members[i]->prediction;

        AgentContribution ac;
        ac.agent = p.agent();
        ac.cycle = members[i]->cycle;
        ac.age_cycles = ages[i];
        ac.score = p.score();
        ac.confidence = p.confidence();
        ac.weight = p.confidence() * std::pow(policy_.recency_decay, ages[i]);
        ac.model_version = p.modelVersion();
        ac.supporting = p.score() >= v.threshold;

        weight_sum += ac.weight;
        weighted_score += ac.weight * ac.score;

        if (ac.supporting) {
            signals.insert({ac.agent, ac.cycle});
            if (ac.cycle == cycle) {
                v.current_signals++;
                current_agents.insert(ac.agent);
            }
            supporting.push_back(&p);
        }
        v.contributions.push_back(std::move(ac));
    }

    v.vote = weight_sum > 0.0 ? weighted_score / weight_sum : 0.0;
    v.signals = signals.size();
    v.current_agents = current_agents.size();
    v.qualifies = v.vote > v.threshold &&
                  v.signals >= policy_.min_signals &&
                  v.current_signals >= 1;
    v.severity = deriveSeverity(v.vote, v.current_agents);

    // Strongest evidence first; newer wins a tie.
    std::stable_sort(supporting.begin(), supporting.end(),
        [](const Prediction* a, const Prediction* b) {
            if (a->score() != b->score()) return a->score() > b->score();
            return a->window().sequence > b->window().sequence;
        });

    std::set<std::string> seen_agents;
    std::set<std::string> seen_recs;
    std::set<std::string> seen_factors;
    std::vector<std::string> recs;
    for (const Prediction* p : supporting) {
        if (seen_agents.insert(p->agent()).second) {
            v.supporting_agents.push_back(p->agent());
        }
        for (const auto& r : p->evidence().recommendations) {
            if (seen_recs.insert(r).second) recs.push_back(r);
        }
        for (const auto& f : p->evidence().factors) {
            if (seen_factors.insert(f.name).second) v.factors.push_back(f);
        }
    }

    std::string top_agent;
    if (!supporting.empty()) {
        top_agent = supporting.front()->agent();
        v.issue = supporting.front()->evidence().issue;
    }
    if (v.issue.empty()) v.issue = defaultIssue(c);

    if (recs.empty()) {
        v.recommendation = fallbackRecommendation(c, top_agent, v.issue);
    } else {
        for (size_t i = 0; i < recs.size(); ++i) {
            if (i) v.recommendation += "; ";
            v.recommendation += recs[i];
        }
    }
    v.message = describe(v.issue, v.vote, v.factors);
    return v;
}

} // namespace rigsense

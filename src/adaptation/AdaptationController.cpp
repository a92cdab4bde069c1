#include "rigsense/adaptation/AdaptationController.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <utility>

namespace rigsense {

const char* toString(FeedbackResult r) {
    switch (r) {
        case FeedbackResult::Applied:      return "APPLIED";
        case FeedbackResult::Duplicate:    return "DUPLICATE";
        case FeedbackResult::UnknownAlert: return "UNKNOWN_ALERT";
        case FeedbackResult::Suspended:    return "SUSPENDED";
        case FeedbackResult::Rejected:     return "REJECTED";
        case FeedbackResult::NoOp:         return "NOOP";
    }
    return "UNKNOWN";
}

AdaptationController::AdaptationController(
    AgentRegistry& registry,
    AlertBook& book,
    AlertPublisher& publisher,
    const ConstraintChecker& checker,
    AdaptationPolicy defaults
) : registry_(registry),
    book_(book),
    publisher_(publisher),
    checker_(checker),
    defaults_(defaults) {}

void AdaptationController::setPolicy(const std::string& agent, AdaptationPolicy policy) {
    std::lock_guard<std::mutex> lk(mtx_);
    policies_[agent] = policy;
}

AdaptationPolicy AdaptationController::policyFor(const std::string& agent) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return policyLocked(agent);
}

AdaptationPolicy AdaptationController::policyLocked(const std::string& agent) const {
    auto it = policies_.find(agent);
    return it != policies_.end() ? it->second : defaults_;
}

FeedbackResult AdaptationController::apply(const FeedbackEvent& e) {
    std::lock_guard<std::mutex> lk(mtx_);

    if (e.kind == FeedbackKind::Missed) {
        if (!applied_missed_[e.category].insert(e.event_id)) {
            std::cout << "[ADAPT] duplicate feedback " << e.event_id << " ignored\n";
            return FeedbackResult::Duplicate;
        }
        auto it = latest_.find(e.category);
        if (it == latest_.end() || it->second.empty()) {
            std::cout << "[ADAPT] missed " << toString(e.category)
                      << ": no recent predictions to adjust\n";
            return FeedbackResult::NoOp;
        }
        return applyOutcome(it->second, 1.0, "missed");
    }

    Alert alert;
    if (!book_.get(e.alert_id, alert)) {
        std::cerr << "[ADAPT] feedback " << e.event_id
                  << " references unknown alert " << e.alert_id << "\n";
        return FeedbackResult::UnknownAlert;
    }
    if (!applied_[e.alert_id].insert(e.event_id).second) {
        std::cout << "[ADAPT] duplicate feedback " << e.event_id << " ignored\n";
        return FeedbackResult::Duplicate;
    }

    // Latest supporting score per agent.
    std::map<std::string, const AgentContribution*> newest;
    for (const auto& c : alert.contributions) {
        if (!c.supporting) continue;
        auto& slot = newest[c.agent];
        if (!slot || c.cycle > slot->cycle) slot = &c;
    }
    std::vector<Observed> observed;
    for (const auto& name : alert.supporting_agents) {
        auto it = newest.find(name);
        if (it != newest.end()) observed.push_back(Observed{name, it->second->score});
    }

    bool confirmed = e.kind == FeedbackKind::Confirmed;
    FeedbackResult result = applyOutcome(
        observed,
        confirmed ? 1.0 : 0.0,
        confirmed ? "confirmed" : "false_positive");

    book_.transition(e.alert_id, confirmed ? AlertState::Confirmed : AlertState::Dismissed);
    return result;
}

FeedbackResult AdaptationController::applyOutcome(
    const std::vector<Observed>& observed,
    double target,
    const char* cause
) {
    bool any_accepted = false;
    bool any_rejected = false;
    bool any_suspended = false;

    for (const auto& o : observed) {
        AgentAdapter* agent = registry_.find(o.agent);
        if (!agent) continue;

        double step = policyLocked(o.agent).step;
        double err = target - o.score;

        Outcome r = update(
            *agent,
            step * err * 0.5,
            step * err * 0.25,
            step * (1.0 - 2.0 * std::fabs(err)),
            cause);

        any_accepted |= r == Outcome::Accepted;
        any_rejected |= r == Outcome::Rejected;
        any_suspended |= r == Outcome::Suspended;
    }

    if (any_accepted) return FeedbackResult::Applied;
    if (any_rejected) return FeedbackResult::Rejected;
    if (any_suspended) return FeedbackResult::Suspended;
    return FeedbackResult::NoOp;
}

AdaptationController::Outcome AdaptationController::update(
    AgentAdapter& agent,
    double d_sensitivity,
    double d_bias,
    double d_reliability,
    const char* cause
) {
    const std::string& name = agent.name();
    if (suspended_.count(name)) {
        std::cout << "[ADAPT] " << name << " suspended, " << cause << " update skipped\n";
        return Outcome::Suspended;
    }

    ModelSnapshot current = agent.modelState();
    AgentModelState next = *current;
    next.version = current->version + 1;
    next.sensitivity += d_sensitivity;
    next.bias += d_bias;
    // Reliability saturates at its bounds; sensitivity and bias must stay inside theirs.
    const PhysicsLimits& lim = checker_.limits();
    next.reliability = std::min(lim.max_reliability,
        std::max(lim.min_reliability, current->reliability + d_reliability));

    ConstraintVerdict v = checker_.check(*current, next);
    if (!v) {
        rejected_.fetch_add(1);
        uint32_t streak = ++rejections_[name];
        std::cerr << "[ADAPT] rejected " << name
                  << " cause=" << cause
                  << " code=" << toString(v.code)
                  << " reason=" << v.reason
                  << " streak=" << streak << "\n";

        if (streak >= policyLocked(name).divergence_trip) {
            suspended_.insert(name);
            publisher_.raiseDivergence(name, v.reason);
        }
        return Outcome::Rejected;
    }

    rejections_[name] = 0;
    std::cout << "[ADAPT] " << name
              << " v" << current->version << "->v" << next.version
              << " cause=" << cause
              << " sensitivity=" << next.sensitivity
              << " reliability=" << next.reliability
              << " bias=" << next.bias << "\n";
    agent.install(std::make_shared<const AgentModelState>(std::move(next)));
    accepted_.fetch_add(1);
    return Outcome::Accepted;
}

size_t AdaptationController::drain(FeedbackStream& stream) {
    size_t n = 0;
    FeedbackEvent e;
    while (stream.tryPop(e)) {
        FeedbackResult r = apply(e);
        std::cout << "[ADAPT] feedback " << e.event_id << " -> " << toString(r) << "\n";
        n++;
    }
    forgetRetired();
    return n;
}

bool AdaptationController::RecentIds::insert(const std::string& id) {
    if (!ids.insert(id).second) return false;
    order.push_back(id);
    while (order.size() > kMissedMemory) {
        ids.erase(order.front());
        order.pop_front();
    }
    return true;
}

size_t AdaptationController::forgetRetired() {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t forgotten = 0;
    Alert scratch;
    for (auto it = applied_.begin(); it != applied_.end();) {
        if (book_.get(it->first, scratch)) {
            ++it;
            continue;
        }
        it = applied_.erase(it);
        forgotten++;
    }
    return forgotten;
}

size_t AdaptationController::trackedAlerts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return applied_.size();
}

size_t AdaptationController::trackedMissed(Category c) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = applied_missed_.find(c);
    return it != applied_missed_.end() ? it->second.ids.size() : 0;
}

void AdaptationController::recordPredictions(const std::vector<Prediction>& accepted) {
    std::map<Category, std::vector<Observed>> fresh;
    for (const auto& p : accepted) {
        fresh[p.category()].push_back(Observed{p.agent(), p.score()});
    }

    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : fresh) {
        latest_[kv.first] = std::move(kv.second);
    }
}

void AdaptationController::penalize(const Prediction& rejected, const ConstraintVerdict& verdict) {
    AgentAdapter* agent = registry_.find(rejected.agent());
    if (!agent) return;

    std::lock_guard<std::mutex> lk(mtx_);
    std::cout << "[ADAPT] physics penalty " << rejected.agent()
              << " (" << toString(verdict.code) << ")\n";
    update(*agent, 0.0, 0.0, -policyLocked(rejected.agent()).step * 0.5, "physics");
}

bool AdaptationController::acknowledgeRecalibration(const std::string& name, bool reset_to_defaults) {
    AgentAdapter* agent = registry_.find(name);
    if (!agent) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    suspended_.erase(name);
    rejections_[name] = 0;

    if (reset_to_defaults) {
        AgentModelState fresh = agent->defaults();
        fresh.version = agent->modelState()->version + 1;
        ConstraintVerdict v = checker_.checkBounds(fresh);
        if (!v) {
            std::cerr << "[ADAPT] defaults of " << name << " out of bounds: " << v.reason << "\n";
        } else {
            agent->install(std::make_shared<const AgentModelState>(std::move(fresh)));
            std::cout << "[ADAPT] " << name << " reset to defaults\n";
        }
    }

    publisher_.clearDivergence(name);
    std::cout << "[ADAPT] recalibration acknowledged for " << name << "\n";
    return true;
}

bool AdaptationController::diverged(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return suspended_.count(name) != 0;
}

uint32_t AdaptationController::consecutiveRejections(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = rejections_.find(name);
    return it != rejections_.end() ? it->second : 0;
}

} // namespace rigsense

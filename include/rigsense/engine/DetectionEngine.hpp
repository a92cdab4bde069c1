#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "rigsense/adaptation/AdaptationController.hpp"
#include "rigsense/agents/AgentRegistry.hpp"
#include "rigsense/alerts/AlertBook.hpp"
#include "rigsense/alerts/AlertPublisher.hpp"
#include "rigsense/config/EngineConfig.hpp"
#include "rigsense/core/Clock.hpp"
#include "rigsense/consensus/ConsensusAggregator.hpp"
#include "rigsense/engine/EngineStatus.hpp"
#include "rigsense/physics/ConstraintChecker.hpp"
#include "rigsense/telemetry/WindowSource.hpp"

namespace rigsense {

enum class CyclePhase : uint8_t {
    Idle = 0,
    FanOut,
    Collect,
    Aggregate,
    Publish,
    Adapt
};

const char* toString(CyclePhase p);

struct AgentOutcome {
    enum Kind : uint8_t { Ok, Timeout, Unavailable, InvalidWindow, Rejected };

    std::string agent;
    Category category = Category::Sticking;
    Kind kind = Ok;
    std::string detail;
};

struct CycleReport {
    uint64_t cycle = 0;
    uint64_t window_sequence = 0;
    bool skipped = false;

    std::vector<AgentOutcome> outcomes;
    std::vector<Prediction> accepted;
    CycleDecision decision;
    std::vector<Alert> published;

    std::array<bool, kCategoryCount> degraded{};
    bool global_degraded = false;

    size_t feedback_consumed = 0;
    uint64_t latency_us = 0;

    size_t count(AgentOutcome::Kind k) const;
};

// ---------------------------------------------------------------------------
// One detection cycle per window:
//
//   FanOut    every adapter's predict() posted to the worker pool, except
//             an adapter whose abandoned call is still running: it is a
//             Timeout for the cycle, so one hung adapter holds one worker
//   Collect   futures awaited until the cycle deadline; late ones abandoned
//   Aggregate physics filter, then consensus, in strict cycle order
//   Publish   alert book dedup, then queued on the publisher; its own
//             thread talks to the sinks
//   Adapt     queued feedback drained into the adaptation controller
//
// No agent fault stops the loop. A category whose agents all failed to
// answer is flagged degraded; all categories degraded raises the global
// flag.
// ---------------------------------------------------------------------------
class DetectionEngine {
public:
    DetectionEngine(const EngineConfig& cfg, AgentRegistry registry);
    ~DetectionEngine();

    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    // Safe to call from several threads; aggregation still runs in cycle order.
    CycleReport runCycle(const WindowPtr& window);

    // Pulls a window per interval until `running` drops or the source ends.
    void run(WindowSource& source, const std::atomic<bool>& running);

    CyclePhase phase() const { return phase_.load(); }

    AgentRegistry& agents() { return registry_; }
    const ConstraintChecker& checker() const { return checker_; }
    ConsensusAggregator& consensus() { return aggregator_; }
    AlertBook& alerts() { return book_; }
    AlertPublisher& publisher() { return publisher_; }
    AdaptationController& adaptation() { return controller_; }
    EngineStatus& status() { return status_; }

private:
    // Per adapter, in registry order.
    struct Lane {
        std::atomic<uint32_t> abandoned{0};   // timed-out calls still on the pool
    };

    void collect(
        const WindowPtr& window,
        CycleReport& report
    );

    void markCoverage(CycleReport& report);
    void refreshStatus(const CycleReport& report);

    EngineConfig cfg_;
    AgentRegistry registry_;
    ConstraintChecker checker_;
    ConsensusAggregator aggregator_;
    AlertBook book_;
    AlertPublisher publisher_;
    AdaptationController controller_;
    EngineStatus status_;
    FeedbackStream& feedback_;

    std::atomic<CyclePhase> phase_{CyclePhase::Idle};

    std::mutex order_mtx_;
    std::condition_variable order_cv_;
    uint64_t last_sequence_ = 0;
    uint64_t next_cycle_ = 0;
    uint64_t completed_cycle_ = 0;

    infra::MonoTime started_;

    std::vector<std::unique_ptr<Lane>> lanes_;

    boost::asio::thread_pool pool_;
};

} // namespace rigsense

#include "rigsense/engine/DetectionEngine.hpp"
#include "rigsense/core/Clock.hpp"
#include "rigsense/core/Errors.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace rigsense {

const char* toString(CyclePhase p) {
    switch (p) {
        case CyclePhase::Idle:      return "IDLE";
        case CyclePhase::FanOut:    return "FAN_OUT";
        case CyclePhase::Collect:   return "COLLECT";
        case CyclePhase::Aggregate: return "AGGREGATE";
        case CyclePhase::Publish:   return "PUBLISH";
        case CyclePhase::Adapt:     return "ADAPT";
    }
    return "UNKNOWN";
}

size_t CycleReport::count(AgentOutcome::Kind k) const {
    size_t n = 0;
    for (const auto& o : outcomes) {
        if (o.kind == k) n++;
    }
    return n;
}

namespace {

// Hands the aggregation turn to the next cycle even when this one unwinds.
class CycleTurn {
public:
    CycleTurn(std::mutex& m, std::condition_variable& cv, uint64_t& completed, uint64_t cycle)
        : m_(m), cv_(cv), completed_(completed), cycle_(cycle) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return completed_ + 1 == cycle_; });
    }

    ~CycleTurn() {
        {
            std::lock_guard<std::mutex> lk(m_);
            completed_ = cycle_;
        }
        cv_.notify_all();
    }

    CycleTurn(const CycleTurn&) = delete;
    CycleTurn& operator=(const CycleTurn&) = delete;

private:
    std::mutex& m_;
    std::condition_variable& cv_;
    uint64_t& completed_;
    uint64_t cycle_;
};

} // namespace

DetectionEngine::DetectionEngine(const EngineConfig& cfg, AgentRegistry registry)
    : cfg_(cfg),
      registry_(std::move(registry)),
      checker_(cfg.physics),
      aggregator_(cfg.consensus),
      book_(cfg.alerts),
      publisher_(cfg.publisher),
      controller_(registry_, book_, publisher_, checker_),
      feedback_(publisher_.subscribeFeedback()),
      started_(infra::now()),
      pool_(cfg.worker_threads) {
    for (const auto& kv : cfg_.agents) {
        controller_.setPolicy(kv.first, kv.second.adaptation);
    }
    for (size_t i = 0; i < registry_.size(); ++i) {
        lanes_.push_back(std::make_unique<Lane>());
    }
    publisher_.start();
    std::cout << "[ENGINE] " << registry_.size() << " agents, "
              << cfg_.worker_threads << " workers, interval="
              << cfg_.cycle_interval_ms << "ms deadline="
              << cfg_.cycle_deadline_ms << "ms\n";
}

DetectionEngine::~DetectionEngine() {
    publisher_.stop();
    feedback_.close();
    pool_.stop();
    pool_.join();
}

CycleReport DetectionEngine::runCycle(const WindowPtr& window) {
    auto t0 = infra::now();
    CycleReport report;

    if (!window) {
        report.skipped = true;
        status_.windows_skipped.fetch_add(1);
        std::cerr << "[ENGINE] null window skipped\n";
        return report;
    }
    report.window_sequence = window->sequence();

    if (window->sequence() == 0) {
        report.skipped = true;
        status_.windows_skipped.fetch_add(1);
        std::cerr << "[ENGINE] window without a sequence number skipped\n";
        return report;
    }

    {
        std::lock_guard<std::mutex> lk(order_mtx_);
        if (window->sequence() <= last_sequence_) {
            report.skipped = true;
            status_.windows_skipped.fetch_add(1);
            std::cerr << "[ENGINE] window " << window->sequence()
                      << " out of order (last " << last_sequence_ << "), skipped\n";
            return report;
        }
        last_sequence_ = window->sequence();
        report.cycle = ++next_cycle_;
    }

    collect(window, report);

    CycleTurn turn(order_mtx_, order_cv_, completed_cycle_, report.cycle);

    phase_.store(CyclePhase::Aggregate);
    markCoverage(report);

    WindowRef ref{window->sequence(), window->endMs()};
    report.decision = aggregator_.aggregate(
        report.cycle, ref, cfg_.cycle_interval_ms, report.accepted);
    controller_.recordPredictions(report.accepted);

    phase_.store(CyclePhase::Publish);

    uint64_t now_ms = infra::wall_ms();
    for (const auto& vote : report.decision.alerts) {
        bool refreshed = false;
        Alert alert = book_.raiseOrRefresh(vote, report.cycle, ref, now_ms, refreshed);
        (refreshed ? status_.alerts_refreshed : status_.alerts_raised).fetch_add(1);
        publisher_.publish(alert);
        report.published.push_back(std::move(alert));
    }
    status_.alerts_expired.fetch_add(book_.expire(now_ms).size());

    phase_.store(CyclePhase::Adapt);
    report.feedback_consumed = controller_.drain(feedback_);
    status_.feedback_consumed.fetch_add(report.feedback_consumed);

    report.latency_us = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(infra::now() - t0).count());
    refreshStatus(report);
    phase_.store(CyclePhase::Idle);

    std::cout << "[ENGINE] cycle " << report.cycle
              << " window=" << report.window_sequence
              << " accepted=" << report.accepted.size()
              << " timeouts=" << report.count(AgentOutcome::Timeout)
              << " alerts=" << report.published.size()
              << " latency=" << report.latency_us << "us\n";
    return report;
}

void DetectionEngine::collect(const WindowPtr& window, CycleReport& report) {
    phase_.store(CyclePhase::FanOut);

    enum : int { kRunning = 0, kDone, kAbandoned };

    struct Pending {
        const AgentAdapter* agent;
        Lane* lane;
        std::shared_ptr<std::atomic<int>> state;   // null when not posted
        std::future<Prediction> result;
    };
    std::vector<Pending> pending;
    pending.reserve(registry_.size());

    auto deadline = infra::now() + std::chrono::milliseconds(cfg_.cycle_deadline_ms);

    const auto& agents = registry_.all();
    for (size_t i = 0; i < agents.size(); ++i) {
        const AgentAdapter* agent = agents[i].get();
        Lane* lane = lanes_[i].get();

        if (lane->abandoned.load() > 0) {
            pending.push_back(Pending{agent, lane, nullptr, std::future<Prediction>()});
            continue;
        }

        auto state = std::make_shared<std::atomic<int>>(kRunning);
        auto task = std::make_shared<std::packaged_task<Prediction()>>(
            [agent, window] { return agent->predict(*window); });
        pending.push_back(Pending{agent, lane, state, task->get_future()});
        boost::asio::post(pool_, [task, state, lane] {
            (*task)();
            if (state->exchange(kDone) == kAbandoned) {
                lane->abandoned.fetch_sub(1);
            }
        });
    }

    phase_.store(CyclePhase::Collect);

    for (auto& p : pending) {
        AgentOutcome outcome;
        outcome.agent = p.agent->name();
        outcome.category = p.agent->category();

        if (!p.state) {
            outcome.kind = AgentOutcome::Timeout;
            outcome.detail = "previous call still running";
            status_.agent_timeouts.fetch_add(1);
            std::cerr << "[AGENT] " << outcome.agent << " still busy, no call in cycle "
                      << report.cycle << "\n";
            report.outcomes.push_back(std::move(outcome));
            continue;
        }

        if (p.result.wait_until(deadline) != std::future_status::ready) {
            // Abandoned: the worker finishes on its own and the result is dropped.
            p.lane->abandoned.fetch_add(1);
            int expected = kRunning;
            if (!p.state->compare_exchange_strong(expected, kAbandoned)) {
                p.lane->abandoned.fetch_sub(1);   // finished just past the deadline
            }
            outcome.kind = AgentOutcome::Timeout;
            outcome.detail = "deadline exceeded";
            status_.agent_timeouts.fetch_add(1);
            std::cerr << "[AGENT] " << outcome.agent << " timed out in cycle "
                      << report.cycle << "\n";
            report.outcomes.push_back(std::move(outcome));
            continue;
        }

        try {
            Prediction prediction = p.result.get();
            ConstraintVerdict verdict = checker_.check(prediction);
            if (!verdict) {
                outcome.kind = AgentOutcome::Rejected;
                outcome.detail = verdict.reason;
                status_.physics_rejections.fetch_add(1);
                std::cerr << "[PHYSICS] rejected " << outcome.agent
                          << " code=" << toString(verdict.code)
                          << " reason=" << verdict.reason << "\n";
                controller_.penalize(prediction, verdict);
            } else {
                status_.predictions_accepted.fetch_add(1);
                report.accepted.push_back(std::move(prediction));
            }
        } catch (const AgentError& e) {
            if (e.fault() == AgentFault::InvalidWindow) {
                outcome.kind = AgentOutcome::InvalidWindow;
                status_.invalid_windows.fetch_add(1);
            } else {
                outcome.kind = AgentOutcome::Unavailable;
                status_.agent_unavailable.fetch_add(1);
            }
            outcome.detail = e.what();
            std::cerr << "[AGENT] " << outcome.agent << " " << toString(e.fault())
                      << ": " << e.what() << "\n";
        } catch (const std::exception& e) {
            outcome.kind = AgentOutcome::Unavailable;
            outcome.detail = e.what();
            status_.agent_unavailable.fetch_add(1);
            std::cerr << "[AGENT] " << outcome.agent << " failed: " << e.what() << "\n";
        }
        report.outcomes.push_back(std::move(outcome));
    }
}

void DetectionEngine::markCoverage(CycleReport& report) {
    std::vector<Category> served = registry_.categories();
    size_t degraded = 0;

    for (Category c : served) {
        size_t agents = 0;
        size_t missing = 0;
        for (const auto& o : report.outcomes) {
            if (o.category != c) continue;
            agents++;
            if (o.kind == AgentOutcome::Timeout || o.kind == AgentOutcome::Unavailable) {
                missing++;
            }
        }
        bool lost = agents > 0 && missing == agents;
        report.degraded[static_cast<size_t>(c)] = lost;
        publisher_.setDegraded(c, lost);
        if (lost) degraded++;
    }

    report.global_degraded = !served.empty() && degraded == served.size();
    publisher_.setGlobalDegraded(report.global_degraded);
}

void DetectionEngine::refreshStatus(const CycleReport& report) {
    status_.cycles.fetch_add(1);
    status_.adaptation_accepted.store(controller_.accepted());
    status_.adaptation_rejected.store(controller_.rejected());
    status_.set_health(publisher_.health());
    status_.set_pending_alerts(book_.pendingCount());
    status_.set_last_cycle(report.cycle, report.window_sequence, report.latency_us);
    status_.set_uptime(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(infra::now() - started_).count()));
}

void DetectionEngine::run(WindowSource& source, const std::atomic<bool>& running) {
    std::cout << "[ENGINE] detection loop started\n";
    const auto interval = std::chrono::milliseconds(cfg_.cycle_interval_ms);

    while (running.load()) {
        auto next_tick = infra::now() + interval;

        WindowPtr window = source.next();
        if (!window) {
            std::cout << "[ENGINE] window source exhausted\n";
            break;
        }
        runCycle(window);

        while (running.load() && infra::now() < next_tick) {
            auto left = next_tick - infra::now();
            std::this_thread::sleep_for(
                std::min<infra::MonoDur>(left, std::chrono::milliseconds(50)));
        }
    }
    std::cout << "[ENGINE] detection loop stopped after "
              << status_.cycles.load() << " cycles\n";
}

} // namespace rigsense

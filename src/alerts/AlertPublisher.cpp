#include "rigsense/alerts/AlertPublisher.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace rigsense {

AlertPublisher::AlertPublisher(PublisherPolicy policy)
    : policy_(policy) {
    if (policy_.max_attempts == 0) policy_.max_attempts = 1;
}

AlertPublisher::~AlertPublisher() {
    stop();
}

void AlertPublisher::start() {
    std::lock_guard<std::mutex> lk(queue_mtx_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this] { run(); });
    std::cout << "[PUBLISH] delivery thread started\n";
}

void AlertPublisher::stop() {
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        if (!running_) return;
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    std::cout << "[PUBLISH] delivery thread stopped, "
              << pendingRedelivery() << " awaiting redelivery\n";
}

void AlertPublisher::run() {
    const auto interval = std::chrono::milliseconds(policy_.retry_interval_ms);
    for (;;) {
        bool running;
        {
            std::unique_lock<std::mutex> lk(queue_mtx_);
            queue_cv_.wait_for(lk, interval, [this] { return !running_ || !outbox_.empty(); });
            running = running_;
        }
        flush();
        if (!running) break;
    }
}

void AlertPublisher::addSink(std::unique_ptr<AlertSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lk(sink_mtx_);
    std::cout << "[PUBLISH] sink " << sink->name() << " attached\n";
    sinks_.push_back(std::move(sink));
}

size_t AlertPublisher::sinkCount() const {
    std::lock_guard<std::mutex> lk(sink_mtx_);
    return sinks_.size();
}

bool AlertPublisher::tryDeliver(size_t sink, const Alert& alert) {
    try {
        sinks_[sink]->deliver(alert);
        delivered_.fetch_add(1);
        return true;
    } catch (const std::exception& e) {
        failures_.fetch_add(1);
        std::cerr << "[PUBLISH] sink " << sinks_[sink]->name()
                  << " failed alert " << alert.id << ": " << e.what() << "\n";
        return false;
    }
}

void AlertPublisher::publish(const Alert& alert) {
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        outbox_.push_back(alert);
    }
    queue_cv_.notify_one();
}

size_t AlertPublisher::flush() {
    std::deque<Alert> fresh;
    {
        std::lock_guard<std::mutex> lk(queue_mtx_);
        fresh.swap(outbox_);
    }

    std::lock_guard<std::mutex> lk(sink_mtx_);
    size_t ok = 0;
    size_t n = redelivery_.size();

    for (size_t k = 0; k < n; ++k) {
        Redelivery r = std::move(redelivery_.front());
        redelivery_.pop_front();

        if (tryDeliver(r.sink, r.alert)) {
            ok++;
            continue;
        }
        r.attempts++;
        if (r.attempts >= policy_.max_attempts) {
            dropped_.fetch_add(1);
            std::cerr << "[PUBLISH] giving up on alert " << r.alert.id
                      << " for sink " << sinks_[r.sink]->name()
                      << " after " << r.attempts << " attempts\n";
            continue;
        }
        redelivery_.push_back(std::move(r));
    }

    for (const auto& alert : fresh) {
        for (size_t i = 0; i < sinks_.size(); ++i) {
            if (tryDeliver(i, alert)) {
                ok++;
            } else if (policy_.max_attempts > 1) {
                redelivery_.push_back(Redelivery{i, alert, 1});
            } else {
                dropped_.fetch_add(1);
            }
        }
    }
    return ok;
}

size_t AlertPublisher::pendingDelivery() const {
    std::lock_guard<std::mutex> lk(queue_mtx_);
    return outbox_.size();
}

size_t AlertPublisher::pendingRedelivery() const {
    std::lock_guard<std::mutex> lk(sink_mtx_);
    return redelivery_.size();
}

FeedbackStream& AlertPublisher::subscribeFeedback() {
    bool expected = false;
    if (!subscribed_.compare_exchange_strong(expected, true)) {
        throw std::logic_error("feedback stream already has a consumer");
    }
    return feedback_;
}

void AlertPublisher::submitFeedback(FeedbackEvent event) {
    std::cout << "[PUBLISH] feedback " << event.event_id
              << " kind=" << toString(event.kind)
              << " alert=" << event.alert_id << "\n";
    feedback_.push(std::move(event));
}

void AlertPublisher::setDegraded(Category c, bool degraded) {
    std::lock_guard<std::mutex> lk(health_mtx_);
    bool& flag = health_.degraded[static_cast<size_t>(c)];
    if (flag != degraded) {
        std::cout << "[PUBLISH] coverage " << toString(c)
                  << (degraded ? " DEGRADED" : " restored") << "\n";
    }
    flag = degraded;
}

void AlertPublisher::setGlobalDegraded(bool degraded) {
    std::lock_guard<std::mutex> lk(health_mtx_);
    if (health_.global_degraded != degraded) {
        std::cout << "[PUBLISH] global coverage "
                  << (degraded ? "DEGRADED" : "restored") << "\n";
    }
    health_.global_degraded = degraded;
}

void AlertPublisher::raiseDivergence(const std::string& agent, const std::string& reason) {
    std::lock_guard<std::mutex> lk(health_mtx_);
    if (divergence_.emplace(agent, reason).second) {
        std::cerr << "[PUBLISH] MODEL DIVERGENCE agent=" << agent
                  << " reason=" << reason << "\n";
    }
}

void AlertPublisher::clearDivergence(const std::string& agent) {
    std::lock_guard<std::mutex> lk(health_mtx_);
    if (divergence_.erase(agent)) {
        std::cout << "[PUBLISH] divergence cleared agent=" << agent << "\n";
    }
}

bool AlertPublisher::divergenceRaised(const std::string& agent) const {
    std::lock_guard<std::mutex> lk(health_mtx_);
    return divergence_.count(agent) != 0;
}

HealthFlags AlertPublisher::health() const {
    std::lock_guard<std::mutex> lk(health_mtx_);
    HealthFlags h = health_;
    h.diverged_agents.clear();
    for (const auto& kv : divergence_) h.diverged_agents.push_back(kv.first);
    return h;
}

} // namespace rigsense

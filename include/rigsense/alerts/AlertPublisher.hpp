#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rigsense/alerts/Alert.hpp"
#include "rigsense/alerts/AlertSink.hpp"
#include "rigsense/alerts/FeedbackStream.hpp"

namespace rigsense {

struct PublisherPolicy {
    uint32_t max_attempts = 5;         // per sink, first delivery included
    uint64_t retry_interval_ms = 1000; // delivery thread retries at least this often
};

// ---------------------------------------------------------------------------
// Hands alerts and health flags to the outside world and takes feedback
// back in.
//
// publish() only queues. flush() delivers the queue and retries failed
// deliveries once; after start() a dedicated thread calls it whenever an
// alert is queued and every retry_interval_ms, so a slow sink never holds
// up the caller. stop() joins the thread after a last flush.
//
// Delivery is at-least-once per sink: a sink that throws keeps the alert in
// the redelivery queue until max_attempts is reached.
// The feedback stream has exactly one consumer.
// ---------------------------------------------------------------------------
class AlertPublisher {
public:
    explicit AlertPublisher(PublisherPolicy policy = PublisherPolicy());
    ~AlertPublisher();

    AlertPublisher(const AlertPublisher&) = delete;
    AlertPublisher& operator=(const AlertPublisher&) = delete;

    void start();
    void stop();

    void addSink(std::unique_ptr<AlertSink> sink);
    size_t sinkCount() const;

    void publish(const Alert& alert);

    // Retries failed deliveries once, then delivers queued alerts.
    // Returns how many deliveries succeeded.
    size_t flush();
    size_t pendingDelivery() const;
    size_t pendingRedelivery() const;

    // Throws std::logic_error on a second subscription.
    FeedbackStream& subscribeFeedback();
    void submitFeedback(FeedbackEvent event);

    void setDegraded(Category c, bool degraded);
    void setGlobalDegraded(bool degraded);

    void raiseDivergence(const std::string& agent, const std::string& reason);
    void clearDivergence(const std::string& agent);
    bool divergenceRaised(const std::string& agent) const;

    HealthFlags health() const;

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t deliveryFailures() const { return failures_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    struct Redelivery {
        size_t sink;
        Alert alert;
        uint32_t attempts;
    };

    bool tryDeliver(size_t sink, const Alert& alert);
    void run();

    PublisherPolicy policy_;

    mutable std::mutex queue_mtx_;
    std::condition_variable queue_cv_;
    std::deque<Alert> outbox_;
    bool running_ = false;
    std::thread worker_;

    mutable std::mutex sink_mtx_;
    std::vector<std::unique_ptr<AlertSink>> sinks_;
    std::deque<Redelivery> redelivery_;

    mutable std::mutex health_mtx_;
    HealthFlags health_;
    std::map<std::string, std::string> divergence_;

    FeedbackStream feedback_;
    std::atomic<bool> subscribed_{false};

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace rigsense

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "rigsense/alerts/Alert.hpp"

namespace rigsense {

// Ordered multi-producer, single-consumer queue of FeedbackEvents.
class FeedbackStream {
public:
    void push(FeedbackEvent e);

    bool tryPop(FeedbackEvent& out);
    bool waitPop(FeedbackEvent& out, std::chrono::milliseconds timeout);

    // Wakes a blocked consumer; later pushes are dropped.
    void close();
    bool closed() const;

    size_t size() const;

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<FeedbackEvent> q_;
    bool closed_ = false;
};

} // namespace rigsense

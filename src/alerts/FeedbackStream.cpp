#include "rigsense/alerts/FeedbackStream.hpp"

#include <iostream>
#include <utility>

namespace rigsense {

void FeedbackStream::push(FeedbackEvent e) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) {
            std::cerr << "[PUBLISH] feedback " << e.event_id << " dropped: stream closed\n";
            return;
        }
        q_.push_back(std::move(e));
    }
    cv_.notify_one();
}

bool FeedbackStream::tryPop(FeedbackEvent& out) {
    std::lock_guard<std::mutex> lk(m_);
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
}

bool FeedbackStream::waitPop(FeedbackEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    if (!cv_.wait_for(lk, timeout, [this] { return !q_.empty() || closed_; })) {
        return false;
    }
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
}

void FeedbackStream::close() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool FeedbackStream::closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
}

size_t FeedbackStream::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
}

} // namespace rigsense

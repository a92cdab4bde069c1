#include "rigsense/alerts/AlertBook.hpp"

#include <iostream>
#include <utility>

namespace rigsense {

AlertBook::AlertBook(AlertBookPolicy policy)
    : policy_(policy) {}

Alert AlertBook::raiseOrRefresh(
    const CategoryVote& vote,
    uint64_t cycle,
    const WindowRef& window,
    uint64_t now_ms,
    bool& refreshed
) {
    std::lock_guard<std::mutex> lk(mtx_);

    Alert* target = nullptr;
    for (auto& kv : active_) {
        if (kv.second.category == vote.category) {
            target = &kv.second;
            break;
        }
    }

    refreshed = target != nullptr;
    if (!target) {
        Alert fresh;
        fresh.id = next_id_++;
        fresh.category = vote.category;
        fresh.raised_ms = now_ms;
        target = &active_.emplace(fresh.id, fresh).first->second;
    } else {
        target->refresh_count++;
    }

    target->severity = vote.severity;
    target->vote = vote.vote;
    target->supporting_agents = vote.supporting_agents;
    target->contributions = vote.contributions;
    target->cycle = cycle;
    target->window_sequence = window.sequence;
    target->window_ts_ms = window.end_ms;
    target->issue = vote.issue;
    target->message = vote.message;
    target->recommendation = vote.recommendation;
    target->factors = vote.factors;
    target->updated_ms = now_ms;

    std::cout << "[ALERT] " << (refreshed ? "refreshed" : "raised")
              << " id=" << target->id
              << " category=" << toString(target->category)
              << " severity=" << toString(target->severity)
              << " vote=" << target->vote
              << " refresh=" << target->refresh_count << "\n";
    return *target;
}

bool AlertBook::transition(uint64_t id, AlertState to, Alert* out) {
    if (to == AlertState::Pending) return false;

    std::lock_guard<std::mutex> lk(mtx_);
    auto it = active_.find(id);
    if (it == active_.end()) return false;

    Alert a = std::move(it->second);
    active_.erase(it);
    a.state = to;

    std::cout << "[ALERT] id=" << a.id << " -> " << toString(to) << "\n";
    if (out) *out = a;
    retire(std::move(a));
    return true;
}

std::vector<Alert> AlertBook::expire(uint64_t now_ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Alert> expired;

    for (auto it = active_.begin(); it != active_.end();) {
        if (now_ms >= it->second.updated_ms &&
            now_ms - it->second.updated_ms >= policy_.expiry_ms) {
            Alert a = std::move(it->second);
            it = active_.erase(it);
            a.state = AlertState::Expired;
            std::cout << "[ALERT] id=" << a.id << " -> EXPIRED\n";
            expired.push_back(a);
            retire(std::move(a));
        } else {
            ++it;
        }
    }
    return expired;
}

bool AlertBook::get(uint64_t id, Alert& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = active_.find(id);
    if (it != active_.end()) {
        out = it->second;
        return true;
    }
    for (const auto& a : history_) {
        if (a.id == id) {
            out = a;
            return true;
        }
    }
    return false;
}

bool AlertBook::pendingFor(Category c, Alert& out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& kv : active_) {
        if (kv.second.category == c) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

std::vector<Alert> AlertBook::active() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Alert> out;
    out.reserve(active_.size());
    for (const auto& kv : active_) out.push_back(kv.second);
    return out;
}

std::vector<Alert> AlertBook::history() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<Alert>(history_.begin(), history_.end());
}

size_t AlertBook::pendingCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.size();
}

void AlertBook::retire(Alert a) {
    history_.push_back(std::move(a));
    while (history_.size() > policy_.history_limit) {
        history_.pop_front();
    }
}

} // namespace rigsense

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

#include "rigsense/alerts/Alert.hpp"
#include "rigsense/consensus/ConsensusAggregator.hpp"

namespace rigsense {

struct AlertBookPolicy {
    uint64_t expiry_ms = 300000;   // Pending alert not refreshed for this long expires
    size_t history_limit = 50;
};

// ---------------------------------------------------------------------------
// Owner of alert lifecycle records.
//
// At most one Pending alert per category: a qualifying vote refreshes the
// existing one in place. Terminal alerts move to a bounded history.
// Transitions leave Pending only; terminal states are final.
// Thread-safe; readers get copies.
// ---------------------------------------------------------------------------
class AlertBook {
public:
    explicit AlertBook(AlertBookPolicy policy = AlertBookPolicy());

    Alert raiseOrRefresh(
        const CategoryVote& vote,
        uint64_t cycle,
        const WindowRef& window,
        uint64_t now_ms,
        bool& refreshed
    );

    // False when the alert is unknown or no longer Pending.
    bool transition(uint64_t id, AlertState to, Alert* out = nullptr);

    // Pending alerts whose last refresh is older than expiry_ms.
    std::vector<Alert> expire(uint64_t now_ms);

    bool get(uint64_t id, Alert& out) const;
    bool pendingFor(Category c, Alert& out) const;

    std::vector<Alert> active() const;
    std::vector<Alert> history() const;

    size_t pendingCount() const;

private:
    void retire(Alert a);

    mutable std::mutex mtx_;
    AlertBookPolicy policy_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, Alert> active_;
    std::deque<Alert> history_;
};

} // namespace rigsense

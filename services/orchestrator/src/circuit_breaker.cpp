#include "../include/circuit_breaker.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include <algorithm>

CircuitBreakerRegistry::CircuitBreakerRegistry(int threshold, Clock::duration ttl, NowFn now)
    : threshold_(std::max(1, threshold)), ttl_(ttl), now_(std::move(now)) {}

BreakerState CircuitBreakerRegistry::state_locked(const Entry& e, Clock::time_point now) const {
    if (!e.opened_at) return BreakerState::Closed;
    if (now < *e.opened_at + ttl_) return BreakerState::Open;
    return BreakerState::HalfOpen;
}

bool CircuitBreakerRegistry::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return true;
    Entry& e = it->second;
    switch (state_locked(e, now_())) {
        case BreakerState::Closed:
            return true;
        case BreakerState::Open:
            return false;
        case BreakerState::HalfOpen:
            if (e.probe_in_flight) return false;
            e.probe_in_flight = true;
            log_line(LogLevel::Info, "breaker", key + " half-open, allowing probe");
            return true;
    }
    return false;
}

void CircuitBreakerRegistry::record_success(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    if (it->second.opened_at) log_line(LogLevel::Info, "breaker", key + " closed");
    entries_.erase(it);
}

void CircuitBreakerRegistry::record_failure(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = now_();
    prune_locked(now);
    Entry& e = entries_[key];
    ++e.consecutive_failures;
    e.last_failure_at = now;
    if (e.probe_in_flight) {
        e.probe_in_flight = false;
        e.opened_at = now;
        log_line(LogLevel::Warn, "breaker", key + " probe failed, reopened");
    } else if (!e.opened_at && e.consecutive_failures >= threshold_) {
        e.opened_at = now;
        log_line(LogLevel::Warn, "breaker", key + " opened after " + std::to_string(e.consecutive_failures) + " consecutive failures");
    }
}

// At most one sweep per TTL.
void CircuitBreakerRegistry::prune_locked(Clock::time_point now) {
    if (now < next_prune_) return;
    next_prune_ = now + ttl_;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->second.probe_in_flight && now - it->second.last_failure_at >= 2 * ttl_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

BreakerState CircuitBreakerRegistry::state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return BreakerState::Closed;
    return state_locked(it->second, now_());
}

int CircuitBreakerRegistry::consecutive_failures(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.consecutive_failures;
}

std::vector<BreakerSnapshot> CircuitBreakerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = now_();
    std::vector<BreakerSnapshot> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) {
        out.push_back({kv.first, kv.second.consecutive_failures, state_locked(kv.second, now)});
    }
    std::sort(out.begin(), out.end(), [](const BreakerSnapshot& a, const BreakerSnapshot& b) { return a.key < b.key; });
    return out;
}

std::string breaker_key(const AgentTarget& target) {
    return std::string(agent_kind_name(target.kind)) + ":" + target.key;
}

const char* breaker_state_name(BreakerState state) {
    switch (state) {
        case BreakerState::Closed: return "closed";
        case BreakerState::Open: return "open";
        case BreakerState::HalfOpen: return "half_open";
    }
    return "closed";
}

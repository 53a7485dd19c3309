#pragma once
#include "../../../shared/cpp/adcp_sdk/include/adcp_types.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class BreakerState { Closed, Open, HalfOpen };

struct BreakerSnapshot {
    std::string key;
    int consecutive_failures{0};
    BreakerState state{BreakerState::Closed};
};

// Per-agent failure gate shared by all requests. Every operation is atomic per key.
//
// closed    -> open       after `threshold` consecutive failures
// open      -> half-open  once `ttl` has elapsed since opened_at
// half-open -> closed     when the single probe call succeeds
// half-open -> open       when the probe fails (opened_at restarts)
//
// Keys with no failure for two TTLs and no probe in flight are forgotten, so
// the map stays bounded by the agents that failed recently.
class CircuitBreakerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    CircuitBreakerRegistry(int threshold, Clock::duration ttl, NowFn now = &Clock::now);

    // False while open. After the TTL, true for exactly one probe until its outcome is recorded.
    bool allow(const std::string& key);
    void record_success(const std::string& key);
    void record_failure(const std::string& key);

    BreakerState state(const std::string& key) const;
    int consecutive_failures(const std::string& key) const;
    std::vector<BreakerSnapshot> snapshot() const;

    int threshold() const { return threshold_; }
    Clock::duration ttl() const { return ttl_; }

private:
    struct Entry {
        int consecutive_failures{0};
        std::optional<Clock::time_point> opened_at;
        Clock::time_point last_failure_at{};
        bool probe_in_flight{false};
    };

    BreakerState state_locked(const Entry& e, Clock::time_point now) const;
    void prune_locked(Clock::time_point now);

    const int threshold_;
    const Clock::duration ttl_;
    NowFn now_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
    Clock::time_point next_prune_{};
};

std::string breaker_key(const AgentTarget& target);
const char* breaker_state_name(BreakerState state);

#include "../include/dispatcher.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

namespace {
struct CallState {
    std::mutex mtx;
    std::condition_variable cv;
    bool done{false};
    RankResponse result;
};
}

Dispatcher::Dispatcher(std::shared_ptr<AgentTransport> transport, CircuitBreakerRegistry& breaker, std::size_t max_in_flight,
                       SpawnFn spawn)
    : transport_(std::move(transport)), breaker_(breaker), max_in_flight_(std::max<std::size_t>(1, max_in_flight)),
      spawn_(std::move(spawn)) {
    if (!spawn_) spawn_ = [](std::function<void()> fn) { return std::thread(std::move(fn)); };
}

std::vector<AgentOutcome> Dispatcher::dispatch(const std::vector<ResolvedTarget>& targets,
                                               const std::string& brief,
                                               std::chrono::milliseconds timeout,
                                               const std::string& context_id) {
    timeout = std::min<std::chrono::milliseconds>(timeout, kMaxCallTimeout);
    std::vector<AgentOutcome> outcomes(targets.size());
    std::vector<std::size_t> eligible;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        outcomes[i].target = targets[i].target;
        if (targets[i].rejection) {
            outcomes[i].error = targets[i].rejection;
            continue;
        }
        if (!breaker_.allow(breaker_key(targets[i].target))) {
            outcomes[i].error = make_error(error_kind::circuit_open, "Circuit breaker open - agent skipped");
            log_line(LogLevel::Info, "dispatcher", breaker_key(targets[i].target) + " skipped, breaker open", context_id);
            continue;
        }
        eligible.push_back(i);
    }
    if (eligible.empty()) return outcomes;

    // Each worker owns one in-flight slot and pulls the next eligible target when its call settles.
    std::atomic<std::size_t> cursor{0};
    auto worker = [&] {
        for (;;) {
            std::size_t n = cursor.fetch_add(1);
            if (n >= eligible.size()) return;
            std::size_t idx = eligible[n];
            outcomes[idx] = call_one(targets[idx].target, brief, timeout, context_id);
        }
    };

    std::size_t workers = std::min(max_in_flight_, eligible.size());
    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (std::size_t i = 0; i < workers; ++i) pool.push_back(spawn_(worker));
    } catch (const std::system_error& e) {
        // Workers already running drain the remaining targets through the cursor.
        log_line(LogLevel::Warn, "dispatcher", "started " + std::to_string(pool.size()) + " of " +
                 std::to_string(workers) + " workers: " + e.what(), context_id);
        if (pool.empty()) worker();
    }
    for (auto& t : pool) t.join();
    return outcomes;
}

AgentOutcome Dispatcher::call_one(const AgentTarget& target, const std::string& brief,
                                  std::chrono::milliseconds timeout, const std::string& context_id) {
    using namespace std::chrono;
    const std::string key = breaker_key(target);
    const auto started = steady_clock::now();
    const Deadline deadline = started + timeout;

    AgentOutcome outcome;
    outcome.target = target;

    auto state = std::make_shared<CallState>();
    try {
        spawn_([transport = transport_, state, target, brief, deadline, context_id] {
            RankResponse r;
            try {
                r = transport->rank(target, brief, deadline, context_id);
            } catch (const std::exception& e) {
                r = RankResponse{};
                r.error = make_error(error_kind::internal, std::string("Unexpected error: ") + e.what());
            }
            std::lock_guard<std::mutex> lock(state->mtx);
            state->result = std::move(r);
            state->done = true;
            state->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->result.error = make_error(error_kind::internal, std::string("could not start agent call: ") + e.what());
        state->done = true;
    }

    {
        std::unique_lock<std::mutex> lock(state->mtx);
        if (state->cv.wait_until(lock, deadline, [&] { return state->done; })) {
            outcome.items = std::move(state->result.items);
            outcome.error = std::move(state->result.error);
        } else {
            outcome.error = make_error(error_kind::timeout, timeout_message((long)timeout.count()));
        }
    }

    long elapsed = (long)duration_cast<milliseconds>(steady_clock::now() - started).count();
    if (outcome.ok()) {
        breaker_.record_success(key);
        log_line(LogLevel::Debug, "dispatcher", key + " ok items=" + std::to_string(outcome.items.size()) +
                 " elapsed_ms=" + std::to_string(elapsed), context_id);
    } else {
        breaker_.record_failure(key);
        log_line(LogLevel::Warn, "dispatcher", key + " failed type=" + outcome.error->type + " elapsed_ms=" +
                 std::to_string(elapsed) + " msg=" + outcome.error->message, context_id);
    }
    return outcome;
}

#pragma once
#include "agent_resolver.hpp"
#include "circuit_breaker.hpp"
#include "transport.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Runs one transport call per eligible target with at most `max_in_flight`
// calls outstanding. A call still running at its deadline is abandoned and
// recorded as a timeout; it keeps the transport alive through its own
// shared_ptr until it returns.
class Dispatcher {
public:
    // Starts a thread running the given function. Throws std::system_error when
    // no thread can be created.
    using SpawnFn = std::function<std::thread(std::function<void()>)>;

    // Per-call deadlines are capped here so started + timeout stays representable.
    static constexpr std::chrono::hours kMaxCallTimeout{24};

    Dispatcher(std::shared_ptr<AgentTransport> transport, CircuitBreakerRegistry& breaker, std::size_t max_in_flight,
               SpawnFn spawn = {});

    // Outcomes come back in the order of `targets`. Every target admitted by the
    // breaker gets its outcome recorded, even when worker threads cannot be started.
    std::vector<AgentOutcome> dispatch(const std::vector<ResolvedTarget>& targets,
                                       const std::string& brief,
                                       std::chrono::milliseconds timeout,
                                       const std::string& context_id);

private:
    AgentOutcome call_one(const AgentTarget& target, const std::string& brief,
                          std::chrono::milliseconds timeout, const std::string& context_id);

    std::shared_ptr<AgentTransport> transport_;
    CircuitBreakerRegistry& breaker_;
    std::size_t max_in_flight_;
    SpawnFn spawn_;
};

#pragma once
#include "agent_resolver.hpp"
#include "aggregator.hpp"
#include "circuit_breaker.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "registry.hpp"
#include "transport.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

// Request-level validation failure, raised before anything is dispatched.
class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string& msg) : std::runtime_error(msg) {}
};

struct BriefRequest {
    std::string brief;
    AgentSelection selection;
    std::optional<long> timeout_ms; // config default when absent or 0
    bool sort_by_score{false};
};

class Orchestrator {
public:
    Orchestrator(const OrchestratorConfig& config, AgentRegistry& registry,
                 CircuitBreakerRegistry& breaker, std::shared_ptr<AgentTransport> transport);

    // Fans the brief out to every selected agent. Per-agent failures land in
    // their outcome; only a blank brief or an out-of-range timeout throws.
    OrchestrationResult run(const BriefRequest& request);

private:
    OrchestratorConfig config_;
    AgentResolver resolver_;
    Dispatcher dispatcher_;
};

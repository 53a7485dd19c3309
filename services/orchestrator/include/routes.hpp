#pragma once
#include "circuit_breaker.hpp"
#include "orchestrator.hpp"
#include "registry.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http_server.hpp"
#include <nlohmann/json.hpp>

// HTTP surface of the orchestrator service:
//   POST /orchestrate   GET /health   GET /breakers
class OrchestratorRoutes {
public:
    OrchestratorRoutes(Orchestrator& orchestrator, AgentRegistry& registry, CircuitBreakerRegistry& breaker);

    HttpReply operator()(const HttpRequest& req);

    // Absent agent lists default to every tenant / every enabled external agent.
    BriefRequest parse_orchestrate_body(const nlohmann::json& body);

private:
    HttpReply orchestrate(const HttpRequest& req);
    HttpReply breakers();

    Orchestrator& orchestrator_;
    AgentRegistry& registry_;
    CircuitBreakerRegistry& breaker_;
};

#pragma once
#include "../../../shared/cpp/adcp_sdk/include/adcp_types.hpp"
#include "../../../shared/cpp/adcp_sdk/include/adcp_wire.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

using Deadline = std::chrono::steady_clock::time_point;

// A ranking capability reachable for one agent target. Implementations report
// every failure in RankResponse::error and must give up at the deadline with a
// "timeout" error.
class AgentTransport {
public:
    virtual ~AgentTransport() = default;
    virtual RankResponse rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                              const std::optional<std::string>& context_id) = 0;
};

// Loopback call to this deployment's per-tenant ranking endpoint. The URL is
// target.endpoint as built by AgentResolver.
class InternalAgentTransport : public AgentTransport {
public:
    RankResponse rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                      const std::optional<std::string>& context_id) override;
};

// Third-party agent speaking the same contract at target.endpoint.
class ExternalAgentTransport : public AgentTransport {
public:
    RankResponse rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                      const std::optional<std::string>& context_id) override;
};

// Picks the transport for target.kind.
class TransportRouter : public AgentTransport {
public:
    TransportRouter(std::shared_ptr<AgentTransport> internal, std::shared_ptr<AgentTransport> external);
    RankResponse rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                      const std::optional<std::string>& context_id) override;

private:
    std::shared_ptr<AgentTransport> internal_;
    std::shared_ptr<AgentTransport> external_;
};

std::string timeout_message(long budget_ms);

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

enum class AgentKind { Internal, External };

struct AgentTarget {
    AgentKind kind{AgentKind::Internal};
    std::string key;      // tenant slug or external URL
    std::string endpoint; // URL the transport posts to
};

struct RankedItem {
    std::string product_id;
    std::string reason;
    std::optional<double> score; // [0,1] when present
};

// Error kinds as they appear in the "type" field on the wire.
namespace error_kind {
inline const char* const invalid_request = "invalid_request";
inline const char* const no_products = "no_products";
inline const char* const ai_config_error = "ai_config_error";
inline const char* const ai_request_error = "ai_request_error";
inline const char* const invalid_response = "invalid_response";
inline const char* const timeout = "timeout";
inline const char* const circuit_open = "circuit_open";
inline const char* const internal = "internal";
}

struct AgentError {
    std::string type;    // one of error_kind, or an agent-supplied kind kept verbatim
    std::string message;
    std::optional<int> status;
};

struct AgentOutcome {
    AgentTarget target;
    std::vector<RankedItem> items;
    std::optional<AgentError> error; // absent on success

    bool ok() const { return !error.has_value(); }
};

struct OrchestrationResult {
    std::string context_id;
    std::size_t total_agents{0};
    long timeout_ms{0};
    std::vector<AgentOutcome> outcomes; // same order as the resolved targets
};

const char* agent_kind_name(AgentKind kind);
int default_status_for(const std::string& type);
AgentError make_error(const std::string& type, const std::string& message);

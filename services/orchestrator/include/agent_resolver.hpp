#pragma once
#include "registry.hpp"
#include "../../../shared/cpp/adcp_sdk/include/adcp_types.hpp"
#include <string>
#include <vector>
#include <optional>

struct AgentSelection {
    std::vector<std::string> internal_slugs;
    std::vector<std::string> external_urls;
};

// A requested agent. Targets with a rejection are never dispatched; the
// rejection becomes their outcome.
struct ResolvedTarget {
    AgentTarget target;
    std::optional<AgentError> rejection;
};

class AgentResolver {
public:
    AgentResolver(AgentRegistry& registry, std::string service_base_url);

    // Internal selectors first, then external URLs, each in submission order.
    // Duplicate keys collapse onto the first occurrence.
    std::vector<ResolvedTarget> resolve(const AgentSelection& selection) const;

    std::string internal_endpoint(const std::string& slug) const;

private:
    AgentRegistry& registry_;
    std::string base_url_;
};

bool is_valid_agent_url(const std::string& url);

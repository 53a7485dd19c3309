#pragma once
#include "../../../shared/cpp/adcp_sdk/include/adcp_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct AggregateOptions {
    bool sort_by_score{false};
};

OrchestrationResult aggregate(std::string context_id, long timeout_ms,
                              std::vector<AgentOutcome> outcomes, const AggregateOptions& opts);

// Stable: descending score, unscored items last, ties keep agent order.
void sort_items_by_score(std::vector<RankedItem>& items);

nlohmann::json result_to_json(const OrchestrationResult& result);
nlohmann::json outcome_to_json(const AgentOutcome& outcome);

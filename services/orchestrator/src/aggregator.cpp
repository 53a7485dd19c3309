#include "../include/aggregator.hpp"
#include "../../../shared/cpp/adcp_sdk/include/adcp_wire.hpp"
#include <algorithm>

using json = nlohmann::json;

OrchestrationResult aggregate(std::string context_id, long timeout_ms,
                              std::vector<AgentOutcome> outcomes, const AggregateOptions& opts) {
    OrchestrationResult r;
    r.context_id = std::move(context_id);
    r.timeout_ms = timeout_ms;
    r.total_agents = outcomes.size();
    r.outcomes = std::move(outcomes);
    for (auto& o : r.outcomes) {
        if (!o.ok()) o.items.clear();
        else if (opts.sort_by_score) sort_items_by_score(o.items);
    }
    return r;
}

void sort_items_by_score(std::vector<RankedItem>& items) {
    std::stable_sort(items.begin(), items.end(), [](const RankedItem& a, const RankedItem& b) {
        if (!a.score) return false;
        if (!b.score) return true;
        return *a.score > *b.score;
    });
}

json outcome_to_json(const AgentOutcome& outcome) {
    json agent = {{"type", agent_kind_name(outcome.target.kind)}};
    agent[outcome.target.kind == AgentKind::Internal ? "slug" : "url"] = outcome.target.key;
    json items = json::array();
    for (const auto& item : outcome.items) items.push_back(json(item));
    return json{
        {"agent", agent},
        {"items", items},
        {"error", outcome.error ? json(*outcome.error) : json(nullptr)}
    };
}

json result_to_json(const OrchestrationResult& result) {
    json results = json::array();
    for (const auto& o : result.outcomes) results.push_back(outcome_to_json(o));
    return json{
        {"total_agents", result.total_agents},
        {"context_id", result.context_id},
        {"timeout_ms", result.timeout_ms},
        {"results", results}
    };
}

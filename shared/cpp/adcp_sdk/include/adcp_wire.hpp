#pragma once
#include "adcp_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

// AdCP ranking contract.
//   request:  {"brief": string, "context_id": string|null}
//   success:  {"items": [{"product_id": string, "reason": string, "score": number|null}]}
//   error:    {"error": {"type": string, "message": string, "status": integer}}

struct RankResponse {
    std::vector<RankedItem> items;
    std::optional<AgentError> error; // set when the body was an error envelope
};

std::string build_rank_request(const std::string& brief, const std::optional<std::string>& context_id);

// Returns false when the body is not JSON or violates the contract; *why gets the reason.
bool parse_rank_response(const std::string& body, RankResponse& out, std::string* why = nullptr);

std::string build_error_body(const AgentError& err);

void to_json(nlohmann::json& j, const RankedItem& item);
void to_json(nlohmann::json& j, const AgentError& err);

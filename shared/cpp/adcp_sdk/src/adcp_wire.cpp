#include "../include/adcp_wire.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {
bool fail(std::string* why, const std::string& msg) {
    if (why) *why = msg;
    return false;
}

bool parse_error_envelope(const json& e, AgentError& out, std::string* why) {
    if (!e.is_object()) return fail(why, "error must be an object");
    if (!e.contains("type") || !e["type"].is_string()) return fail(why, "error.type must be a string");
    if (!e.contains("message") || !e["message"].is_string()) return fail(why, "error.message must be a string");
    out.type = e["type"].get<std::string>();
    out.message = e["message"].get<std::string>();
    auto it = e.find("status");
    if (it == e.end() || it->is_null()) {
        out.status = default_status_for(out.type);
    } else if (it->is_number_integer()) {
        out.status = it->get<int>();
    } else {
        return fail(why, "error.status must be an integer");
    }
    return true;
}

bool parse_item(const json& j, RankedItem& out, std::string* why) {
    if (!j.is_object()) return fail(why, "item must be an object");
    if (!j.contains("product_id") || !j["product_id"].is_string()) return fail(why, "item.product_id must be a string");
    if (!j.contains("reason") || !j["reason"].is_string()) return fail(why, "item.reason must be a string");
    out.product_id = j["product_id"].get<std::string>();
    out.reason = j["reason"].get<std::string>();
    auto it = j.find("score");
    if (it == j.end() || it->is_null()) {
        out.score.reset();
    } else if (it->is_number()) {
        out.score = std::clamp(it->get<double>(), 0.0, 1.0);
    } else {
        return fail(why, "item.score must be a number or null");
    }
    return true;
}
}

std::string build_rank_request(const std::string& brief, const std::optional<std::string>& context_id) {
    json body = {
        {"brief", brief},
        {"context_id", context_id ? json(*context_id) : json(nullptr)}
    };
    return body.dump();
}

bool parse_rank_response(const std::string& body, RankResponse& out, std::string* why) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return fail(why, std::string("malformed JSON: ") + e.what());
    }
    if (!j.is_object()) return fail(why, "response is not a JSON object");

    bool has_items = j.contains("items");
    bool has_error = j.contains("error");
    if (has_items && has_error) return fail(why, "response carries both items and error");

    RankResponse r;
    if (has_error) {
        AgentError err;
        if (!parse_error_envelope(j["error"], err, why)) return false;
        r.error = std::move(err);
        out = std::move(r);
        return true;
    }
    if (!has_items) return fail(why, "response has neither items nor error");

    const json& items = j["items"];
    if (!items.is_array()) return fail(why, "items must be an array");
    r.items.reserve(items.size());
    for (const auto& it : items) {
        RankedItem item;
        if (!parse_item(it, item, why)) return false;
        r.items.push_back(std::move(item));
    }
    out = std::move(r);
    return true;
}

std::string build_error_body(const AgentError& err) {
    json e = err;
    return json({{"error", e}}).dump();
}

void to_json(json& j, const RankedItem& item) {
    j = json{
        {"product_id", item.product_id},
        {"reason", item.reason},
        {"score", item.score ? json(*item.score) : json(nullptr)}
    };
}

void to_json(json& j, const AgentError& err) {
    j = json{
        {"type", err.type},
        {"message", err.message},
        {"status", err.status ? json(*err.status) : json(nullptr)}
    };
}

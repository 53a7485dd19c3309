#include "../include/routes.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include "../../../shared/cpp/adcp_sdk/include/util.hpp"
#include <chrono>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace {
HttpReply json_reply(int status, const json& body) {
    return HttpReply{status, body.dump()};
}

HttpReply detail(int status, const std::string& msg) {
    return json_reply(status, json({{"detail", msg}}));
}

std::vector<std::string> string_list(const json& body, const char* field) {
    const json& v = body.at(field);
    if (!v.is_array()) throw InvalidRequest(std::string(field) + " must be a list of strings");
    std::vector<std::string> out;
    for (const auto& s : v) {
        if (!s.is_string()) throw InvalidRequest(std::string(field) + " must be a list of strings");
        out.push_back(s.get<std::string>());
    }
    return out;
}

bool present(const json& body, const char* field) {
    auto it = body.find(field);
    return it != body.end() && !it->is_null();
}
}

OrchestratorRoutes::OrchestratorRoutes(Orchestrator& orchestrator, AgentRegistry& registry, CircuitBreakerRegistry& breaker)
    : orchestrator_(orchestrator), registry_(registry), breaker_(breaker) {}

HttpReply OrchestratorRoutes::operator()(const HttpRequest& req) {
    if (req.method == "POST" && req.path == "/orchestrate") return orchestrate(req);
    if (req.method == "GET" && req.path == "/health") {
        return json_reply(200, json({{"status", "ok"}, {"service", "adcp-orchestrator"}, {"version", "0.1.0"}}));
    }
    if (req.method == "GET" && req.path == "/breakers") return breakers();
    return json_reply(404, json({{"error", "not found"}}));
}

BriefRequest OrchestratorRoutes::parse_orchestrate_body(const json& body) {
    if (!body.is_object()) throw InvalidRequest("Request body must be a JSON object");
    BriefRequest r;
    if (!body.contains("brief") || !body["brief"].is_string()) throw InvalidRequest("Brief must be non-empty");
    r.brief = body["brief"].get<std::string>();
    if (is_blank(r.brief)) throw InvalidRequest("Brief must be non-empty");

    if (present(body, "internal_tenant_slugs")) {
        r.selection.internal_slugs = string_list(body, "internal_tenant_slugs");
    } else {
        r.selection.internal_slugs = registry_.list_tenant_slugs();
    }
    if (present(body, "external_urls")) {
        r.selection.external_urls = string_list(body, "external_urls");
    } else {
        for (const auto& a : registry_.list_enabled_external_agents()) r.selection.external_urls.push_back(a.url);
    }

    if (present(body, "timeout_ms")) {
        const json& t = body["timeout_ms"];
        if (!t.is_number_integer()) throw InvalidRequest("timeout_ms must be a positive integer");
        if (t.is_number_unsigned() && t.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<long>::max())) {
            throw InvalidRequest("timeout_ms is out of range");
        }
        r.timeout_ms = t.get<long>();
    }
    if (present(body, "sort_by_score")) {
        if (!body["sort_by_score"].is_boolean()) throw InvalidRequest("sort_by_score must be a boolean");
        r.sort_by_score = body["sort_by_score"].get<bool>();
    }
    return r;
}

HttpReply OrchestratorRoutes::orchestrate(const HttpRequest& req) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error& e) {
        return detail(400, std::string("Malformed JSON: ") + e.what());
    }
    try {
        BriefRequest br = parse_orchestrate_body(body);
        if (br.selection.internal_slugs.empty() && br.selection.external_urls.empty()) {
            throw InvalidRequest("No agents available. Please ensure at least one tenant exists or external agent is configured.");
        }
        return json_reply(200, result_to_json(orchestrator_.run(br)));
    } catch (const InvalidRequest& e) {
        log_line(LogLevel::Info, "orchestrator", std::string("rejected request: ") + e.what());
        return detail(400, e.what());
    } catch (const std::exception& e) {
        log_line(LogLevel::Error, "orchestrator", std::string("orchestration failed: ") + e.what());
        return detail(500, std::string("Orchestration failed: ") + e.what());
    }
}

HttpReply OrchestratorRoutes::breakers() {
    json arr = json::array();
    for (const auto& s : breaker_.snapshot()) {
        arr.push_back(json{
            {"key", s.key},
            {"consecutive_failures", s.consecutive_failures},
            {"state", breaker_state_name(s.state)}
        });
    }
    return json_reply(200, json({
        {"threshold", breaker_.threshold()},
        {"ttl_seconds", std::chrono::duration_cast<std::chrono::seconds>(breaker_.ttl()).count()},
        {"breakers", arr}
    }));
}

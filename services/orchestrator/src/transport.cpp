#include "../include/transport.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http.hpp"

namespace {
using UnenvelopedMapper = AgentError (*)(long status, const std::string& body);

std::string body_prefix(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

RankResponse failure(AgentError err) {
    RankResponse r;
    r.error = std::move(err);
    return r;
}

RankResponse post_rank(const std::string& url, const std::string& brief, Deadline deadline,
                       const std::optional<std::string>& context_id, UnenvelopedMapper map_status) {
    using namespace std::chrono;
    long budget_ms = (long)duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    if (budget_ms <= 0) return failure(make_error(error_kind::timeout, timeout_message(0)));

    HttpResponse http;
    try {
        http = http_post_json(url, build_rank_request(brief, context_id), budget_ms);
    } catch (const HttpError& e) {
        if (e.timed_out()) return failure(make_error(error_kind::timeout, timeout_message(budget_ms)));
        return failure(make_error(error_kind::ai_request_error, e.what()));
    }

    RankResponse parsed;
    std::string why;
    bool valid = parse_rank_response(http.body, parsed, &why);
    if (http.status >= 200 && http.status < 300) {
        if (!valid) {
            AgentError err{error_kind::invalid_response, "Agent response does not match AdCP contract: " + why, (int)http.status};
            return failure(std::move(err));
        }
        return parsed;
    }
    // Non-2xx: a well-formed error envelope is surfaced unchanged.
    if (valid && parsed.error) return parsed;
    return failure(map_status(http.status, http.body));
}

AgentError map_internal_status(long status, const std::string& body) {
    std::string type = error_kind::ai_request_error;
    if (status == 404 || status == 400) type = error_kind::invalid_request;
    else if (status == 422) type = error_kind::no_products;
    else if (status == 408) type = error_kind::timeout;
    return AgentError{type, "HTTP " + std::to_string(status) + ": " + body_prefix(body), (int)status};
}

AgentError map_external_status(long status, const std::string& body) {
    return AgentError{error_kind::ai_request_error, "HTTP " + std::to_string(status) + ": " + body_prefix(body), (int)status};
}
}

std::string timeout_message(long budget_ms) {
    return "Request timed out after " + std::to_string(budget_ms) + "ms";
}

RankResponse InternalAgentTransport::rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                                          const std::optional<std::string>& context_id) {
    if (target.endpoint.empty()) {
        return failure(make_error(error_kind::internal, "Internal agent '" + target.key + "' has no endpoint"));
    }
    return post_rank(target.endpoint, brief, deadline, context_id, &map_internal_status);
}

RankResponse ExternalAgentTransport::rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                                          const std::optional<std::string>& context_id) {
    return post_rank(target.endpoint, brief, deadline, context_id, &map_external_status);
}

TransportRouter::TransportRouter(std::shared_ptr<AgentTransport> internal, std::shared_ptr<AgentTransport> external)
    : internal_(std::move(internal)), external_(std::move(external)) {}

RankResponse TransportRouter::rank(const AgentTarget& target, const std::string& brief, Deadline deadline,
                                   const std::optional<std::string>& context_id) {
    AgentTransport* t = target.kind == AgentKind::Internal ? internal_.get() : external_.get();
    if (!t) return failure(make_error(error_kind::internal, std::string("no transport for ") + agent_kind_name(target.kind) + " agents"));
    return t->rank(target, brief, deadline, context_id);
}

#include "../include/adcp_types.hpp"

const char* agent_kind_name(AgentKind kind) {
    return kind == AgentKind::Internal ? "internal" : "external";
}

int default_status_for(const std::string& type) {
    if (type == error_kind::invalid_request) return 400;
    if (type == error_kind::no_products) return 422;
    if (type == error_kind::ai_config_error) return 500;
    if (type == error_kind::ai_request_error) return 502;
    if (type == error_kind::invalid_response) return 502;
    if (type == error_kind::timeout) return 408;
    if (type == error_kind::circuit_open) return 503;
    return 500;
}

AgentError make_error(const std::string& type, const std::string& message) {
    return AgentError{type, message, default_status_for(type)};
}

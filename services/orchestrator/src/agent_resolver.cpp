#include "../include/agent_resolver.hpp"
#include "../../../shared/cpp/adcp_sdk/include/util.hpp"
#include <stdexcept>
#include <unordered_set>

AgentResolver::AgentResolver(AgentRegistry& registry, std::string service_base_url)
    : registry_(registry), base_url_(std::move(service_base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string AgentResolver::internal_endpoint(const std::string& slug) const {
    return base_url_ + "/mcp/agents/" + slug + "/rank";
}

bool is_valid_agent_url(const std::string& url) {
    std::string rest;
    if (url.rfind("http://", 0) == 0) rest = url.substr(7);
    else if (url.rfind("https://", 0) == 0) rest = url.substr(8);
    else return false;
    if (rest.empty() || rest[0] == '/' || rest[0] == ':') return false;
    return rest.find_first_of(" \t\r\n") == std::string::npos;
}

std::vector<ResolvedTarget> AgentResolver::resolve(const AgentSelection& selection) const {
    std::vector<ResolvedTarget> out;
    std::unordered_set<std::string> seen;

    for (const auto& raw : selection.internal_slugs) {
        std::string slug = trim(raw);
        if (!seen.insert("internal:" + slug).second) continue;
        ResolvedTarget rt;
        rt.target = AgentTarget{AgentKind::Internal, slug, internal_endpoint(slug)};
        if (slug.empty()) {
            rt.rejection = AgentError{error_kind::invalid_request, "Tenant slug must be non-empty", 400};
        } else {
            try {
                if (!registry_.tenant_exists(slug)) {
                    rt.rejection = AgentError{error_kind::invalid_request, "Tenant '" + slug + "' not found", 404};
                }
            } catch (const std::exception& e) {
                rt.rejection = make_error(error_kind::internal, std::string("Tenant lookup failed: ") + e.what());
            }
        }
        out.push_back(std::move(rt));
    }

    for (const auto& raw : selection.external_urls) {
        std::string url = trim(raw);
        if (!seen.insert("external:" + url).second) continue;
        ResolvedTarget rt;
        rt.target = AgentTarget{AgentKind::External, url, url};
        if (!is_valid_agent_url(url)) {
            rt.rejection = AgentError{error_kind::invalid_request, "Malformed agent URL '" + url + "'", 400};
        }
        out.push_back(std::move(rt));
    }
    return out;
}

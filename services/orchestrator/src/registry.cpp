#include "../include/registry.hpp"
#include <algorithm>

void InMemoryAgentRegistry::add_tenant(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(tenants_.begin(), tenants_.end(), slug) == tenants_.end()) tenants_.push_back(slug);
}

void InMemoryAgentRegistry::add_external_agent(const std::string& name, const std::string& url, bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    external_.push_back({{name, url}, enabled});
}

bool InMemoryAgentRegistry::tenant_exists(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::find(tenants_.begin(), tenants_.end(), slug) != tenants_.end();
}

std::vector<std::string> InMemoryAgentRegistry::list_tenant_slugs() {
    std::lock_guard<std::mutex> lock(mtx_);
    return tenants_;
}

std::vector<ExternalAgentInfo> InMemoryAgentRegistry::list_enabled_external_agents() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ExternalAgentInfo> out;
    for (const auto& row : external_) {
        if (row.enabled) out.push_back(row.info);
    }
    std::stable_sort(out.begin(), out.end(), [](const ExternalAgentInfo& a, const ExternalAgentInfo& b) {
        return a.name < b.name;
    });
    return out;
}

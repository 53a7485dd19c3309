#pragma once
#include <string>
#include <vector>
#include <mutex>

struct ExternalAgentInfo {
    std::string name;
    std::string url;
};

// Read-only view of tenants and external agents owned by the admin side of the app.
class AgentRegistry {
public:
    virtual ~AgentRegistry() = default;
    virtual bool tenant_exists(const std::string& slug) = 0;
    virtual std::vector<std::string> list_tenant_slugs() = 0;
    virtual std::vector<ExternalAgentInfo> list_enabled_external_agents() = 0;
};

class InMemoryAgentRegistry : public AgentRegistry {
public:
    void add_tenant(const std::string& slug);
    void add_external_agent(const std::string& name, const std::string& url, bool enabled = true);

    bool tenant_exists(const std::string& slug) override;
    std::vector<std::string> list_tenant_slugs() override;
    std::vector<ExternalAgentInfo> list_enabled_external_agents() override;

private:
    struct ExternalRow {
        ExternalAgentInfo info;
        bool enabled{true};
    };
    std::mutex mtx_;
    std::vector<std::string> tenants_;
    std::vector<ExternalRow> external_;
};

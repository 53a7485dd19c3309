#pragma once
#include "registry.hpp"
#include <string>
#include <vector>
#include <mutex>

// Reads the "tenant" and "externalagent" tables of the application database.
class SqliteAgentRegistry : public AgentRegistry {
public:
    explicit SqliteAgentRegistry(const std::string& db_path);
    ~SqliteAgentRegistry() override;
    SqliteAgentRegistry(const SqliteAgentRegistry&) = delete;
    SqliteAgentRegistry& operator=(const SqliteAgentRegistry&) = delete;

    bool tenant_exists(const std::string& slug) override;
    std::vector<std::string> list_tenant_slugs() override;
    std::vector<ExternalAgentInfo> list_enabled_external_agents() override;

private:
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* tenant_by_slug_stmt_ {nullptr};
    struct sqlite3_stmt* tenant_slugs_stmt_ {nullptr};
    struct sqlite3_stmt* enabled_external_stmt_ {nullptr};
};

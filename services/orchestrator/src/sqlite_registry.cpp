#include "../include/sqlite_registry.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Resets the statement on scope exit so a throw mid-iteration leaves it reusable.
struct StmtReset {
    sqlite3_stmt* st;
    ~StmtReset() { sqlite3_reset(st); sqlite3_clear_bindings(st); }
};
}

SqliteAgentRegistry::SqliteAgentRegistry(const std::string& db_path) {
    if (sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    sqlite3_busy_timeout(db_, 30000);
    try {
        prepare_statements();
    } catch (const std::exception&) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteAgentRegistry::~SqliteAgentRegistry() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteAgentRegistry::prepare_statements() {
    const char* by_slug = "SELECT 1 FROM tenant WHERE slug = ? LIMIT 1;";
    if (sqlite3_prepare_v2(db_, by_slug, -1, &tenant_by_slug_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare tenant lookup failed: ") + sqlite3_errmsg(db_));
    }
    const char* slugs = "SELECT slug FROM tenant ORDER BY id;";
    if (sqlite3_prepare_v2(db_, slugs, -1, &tenant_slugs_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare tenant list failed: ") + sqlite3_errmsg(db_));
    }
    const char* external = "SELECT name, base_url FROM externalagent WHERE enabled = 1 ORDER BY name;";
    if (sqlite3_prepare_v2(db_, external, -1, &enabled_external_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare external agent list failed: ") + sqlite3_errmsg(db_));
    }
}

void SqliteAgentRegistry::close_statements() {
    if (tenant_by_slug_stmt_) { sqlite3_finalize(tenant_by_slug_stmt_); tenant_by_slug_stmt_ = nullptr; }
    if (tenant_slugs_stmt_) { sqlite3_finalize(tenant_slugs_stmt_); tenant_slugs_stmt_ = nullptr; }
    if (enabled_external_stmt_) { sqlite3_finalize(enabled_external_stmt_); enabled_external_stmt_ = nullptr; }
}

bool SqliteAgentRegistry::tenant_exists(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{tenant_by_slug_stmt_};
    bind_text(tenant_by_slug_stmt_, 1, slug);
    int rc = sqlite3_step(tenant_by_slug_stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("tenant lookup failed: ") + sqlite3_errmsg(db_));
}

std::vector<std::string> SqliteAgentRegistry::list_tenant_slugs() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{tenant_slugs_stmt_};
    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(tenant_slugs_stmt_)) == SQLITE_ROW) {
        out.push_back(column_text(tenant_slugs_stmt_, 0));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("tenant list failed: ") + sqlite3_errmsg(db_));
    return out;
}

std::vector<ExternalAgentInfo> SqliteAgentRegistry::list_enabled_external_agents() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{enabled_external_stmt_};
    std::vector<ExternalAgentInfo> out;
    int rc;
    while ((rc = sqlite3_step(enabled_external_stmt_)) == SQLITE_ROW) {
        out.push_back({column_text(enabled_external_stmt_, 0), column_text(enabled_external_stmt_, 1)});
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("external agent list failed: ") + sqlite3_errmsg(db_));
    return out;
}

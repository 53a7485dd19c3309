#include "../include/config.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include "../../../shared/cpp/adcp_sdk/include/util.hpp"

OrchestratorConfig load_config_from_env() {
    OrchestratorConfig c;
    c.default_timeout_ms = getenv_positive("ORCH_TIMEOUT_MS_DEFAULT", c.default_timeout_ms);
    c.max_timeout_ms = getenv_positive("ORCH_TIMEOUT_MS_MAX", c.max_timeout_ms);
    if (c.default_timeout_ms > c.max_timeout_ms) {
        log_line(LogLevel::Warn, "config", "ORCH_TIMEOUT_MS_DEFAULT exceeds ORCH_TIMEOUT_MS_MAX, using " +
                 std::to_string(c.max_timeout_ms));
        c.default_timeout_ms = c.max_timeout_ms;
    }
    c.concurrency = static_cast<std::size_t>(getenv_positive("ORCH_CONCURRENCY", static_cast<long>(c.concurrency)));
    c.cb_failure_threshold = static_cast<int>(getenv_positive("CB_FAILURE_THRESHOLD", c.cb_failure_threshold));
    c.cb_ttl = std::chrono::seconds(getenv_positive("CB_TTL_SECONDS", static_cast<long>(c.cb_ttl.count())));
    c.service_base_url = getenv_or("SERVICE_BASE_URL", c.service_base_url);
    while (!c.service_base_url.empty() && c.service_base_url.back() == '/') c.service_base_url.pop_back();
    c.database_path = sqlite_path_from_url(getenv_or("DATABASE_URL", "sqlite:///" + c.database_path));
    c.port = static_cast<int>(getenv_positive("ORCH_PORT", c.port));
    return c;
}

std::string sqlite_path_from_url(const std::string& url) {
    const std::string prefix = "sqlite:///";
    if (url.rfind(prefix, 0) == 0) return url.substr(prefix.size());
    return url;
}

#include "../include/config.hpp"
#include "../include/orchestrator.hpp"
#include "../include/routes.hpp"
#include "../include/sqlite_registry.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http_server.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include "../../../shared/cpp/adcp_sdk/include/util.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_stop = 0;
void on_signal(int) { g_stop = 1; }
}

int main(int, char**) {
    set_log_level(parse_log_level(getenv_or("LOG_LEVEL", "info")));
    OrchestratorConfig cfg = load_config_from_env();
    http_global_init();

    std::unique_ptr<SqliteAgentRegistry> registry;
    try {
        registry = std::make_unique<SqliteAgentRegistry>(cfg.database_path);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] " << e.what() << std::endl;
        return 1;
    }

    CircuitBreakerRegistry breaker(cfg.cb_failure_threshold, cfg.cb_ttl);
    auto transport = std::make_shared<TransportRouter>(
        std::make_shared<InternalAgentTransport>(),
        std::make_shared<ExternalAgentTransport>());
    Orchestrator orchestrator(cfg, *registry, breaker, transport);
    OrchestratorRoutes routes(orchestrator, *registry, breaker);

    HttpServer server([&routes](const HttpRequest& req) { return routes(req); });
    log_line(LogLevel::Info, "orchestrator", "Starting HTTP server on port " + std::to_string(cfg.port) +
             " base_url=" + cfg.service_base_url + " db=" + cfg.database_path +
             " concurrency=" + std::to_string(cfg.concurrency) +
             " timeout_ms=" + std::to_string(cfg.default_timeout_ms));
    if (!server.start(cfg.port)) {
        std::cerr << "[orchestrator] Failed to start HTTP server" << std::endl;
        return 1;
    }

    std::signal(SIGTERM, on_signal);
    std::signal(SIGINT, on_signal);
    while (!g_stop) pause();

    log_line(LogLevel::Info, "orchestrator", "Stopping");
    server.stop();
    return 0;
}

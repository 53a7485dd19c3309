#pragma once
#include <string>
#include <chrono>
#include <cstddef>

struct OrchestratorConfig {
    long default_timeout_ms{8000};  // per-call deadline when the request gives none
    long max_timeout_ms{600000};    // largest per-call deadline a request may ask for
    std::size_t concurrency{8};     // max in-flight agent calls per request
    int cb_failure_threshold{3};    // consecutive failures before the breaker opens
    std::chrono::seconds cb_ttl{60};
    std::string service_base_url{"http://localhost:8000"}; // internal loopback
    std::string database_path{"./data/adcp_demo.sqlite3"};
    int port{8080};
};

// Reads ORCH_TIMEOUT_MS_DEFAULT, ORCH_TIMEOUT_MS_MAX, ORCH_CONCURRENCY, CB_FAILURE_THRESHOLD, CB_TTL_SECONDS,
// SERVICE_BASE_URL, DATABASE_URL and ORCH_PORT.
OrchestratorConfig load_config_from_env();

// "sqlite:///./data/x.sqlite3" -> "./data/x.sqlite3"; plain paths pass through.
std::string sqlite_path_from_url(const std::string& url);

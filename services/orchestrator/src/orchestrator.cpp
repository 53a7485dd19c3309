#include "../include/orchestrator.hpp"
#include "../../../shared/cpp/adcp_sdk/include/log.hpp"
#include "../../../shared/cpp/adcp_sdk/include/util.hpp"
#include <chrono>

Orchestrator::Orchestrator(const OrchestratorConfig& config, AgentRegistry& registry,
                           CircuitBreakerRegistry& breaker, std::shared_ptr<AgentTransport> transport)
    : config_(config),
      resolver_(registry, config.service_base_url),
      dispatcher_(std::move(transport), breaker, config.concurrency) {}

OrchestrationResult Orchestrator::run(const BriefRequest& request) {
    if (is_blank(request.brief)) throw InvalidRequest("Brief must be non-empty");
    // 0 and absent both mean the configured default.
    long timeout_ms = request.timeout_ms.value_or(0);
    if (timeout_ms == 0) timeout_ms = config_.default_timeout_ms;
    if (timeout_ms < 0) throw InvalidRequest("timeout_ms must be a positive integer");
    if (timeout_ms > config_.max_timeout_ms) {
        throw InvalidRequest("timeout_ms must not exceed " + std::to_string(config_.max_timeout_ms));
    }

    auto targets = resolver_.resolve(request.selection);
    std::string context_id = gen_uuid();
    auto started = std::chrono::steady_clock::now();
    log_line(LogLevel::Info, "orchestrator", "dispatching to " + std::to_string(targets.size()) +
             " agents timeout_ms=" + std::to_string(timeout_ms), context_id);

    auto outcomes = dispatcher_.dispatch(targets, trim(request.brief), std::chrono::milliseconds(timeout_ms), context_id);

    std::size_t failed = 0;
    for (const auto& o : outcomes) if (!o.ok()) ++failed;
    long elapsed = (long)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    log_line(LogLevel::Info, "orchestrator", "done agents=" + std::to_string(outcomes.size()) + " failed=" +
             std::to_string(failed) + " elapsed_ms=" + std::to_string(elapsed), context_id);

    AggregateOptions opts;
    opts.sort_by_score = request.sort_by_score;
    return aggregate(std::move(context_id), timeout_ms, std::move(outcomes), opts);
}

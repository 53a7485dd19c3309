#include <catch2/catch_test_macros.hpp>
#include "../include/orchestrator.hpp"
#include "mock_transport.hpp"
#include <regex>

using namespace std::chrono;

namespace {
struct Fixture {
    OrchestratorConfig cfg;
    InMemoryAgentRegistry registry;
    CircuitBreakerRegistry breaker;
    std::shared_ptr<MockTransport> mock = std::make_shared<MockTransport>();

    explicit Fixture(int threshold = 3) : breaker(threshold, seconds(60)) {
        cfg.default_timeout_ms = 1000;
        cfg.concurrency = 4;
        cfg.service_base_url = "http://localhost:8000";
        registry.add_tenant("pub-a");
        registry.add_tenant("pub-b");
    }

    Orchestrator make() { return Orchestrator(cfg, registry, breaker, mock); }
};

BriefRequest brief_for(const std::string& brief, std::vector<std::string> slugs,
                       std::vector<std::string> urls = {}, std::optional<long> timeout_ms = std::nullopt) {
    BriefRequest r;
    r.brief = brief;
    r.selection.internal_slugs = std::move(slugs);
    r.selection.external_urls = std::move(urls);
    r.timeout_ms = timeout_ms;
    return r;
}
}

TEST_CASE("Sports campaign with one slow publisher", "[orchestrator]") {
    Fixture f;
    f.mock->script("pub-a", {milliseconds(20), items_response("pub-a", 2), false});
    f.mock->script("pub-b", {milliseconds(2000), items_response("pub-b", 1), false});
    auto orch = f.make();

    auto start = steady_clock::now();
    auto r = orch.run(brief_for("sports campaign", {"pub-a", "pub-b"}, {}, 500L));
    long took = (long)duration_cast<milliseconds>(steady_clock::now() - start).count();

    REQUIRE(took < 1000);
    REQUIRE(r.total_agents == 2);
    REQUIRE(r.timeout_ms == 500);
    REQUIRE(r.outcomes[0].target.key == "pub-a");
    REQUIRE(r.outcomes[0].ok());
    REQUIRE(r.outcomes[0].items.size() == 2);
    REQUIRE(r.outcomes[1].target.key == "pub-b");
    REQUIRE(r.outcomes[1].error->type == "timeout");
    REQUIRE(r.outcomes[1].error->status == 408);
}

TEST_CASE("Blank briefs are rejected before any dispatch", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    REQUIRE_THROWS_AS(orch.run(brief_for("", {"pub-a"})), InvalidRequest);
    REQUIRE_THROWS_AS(orch.run(brief_for("   \n\t   ", {"pub-a"})), InvalidRequest);
    REQUIRE(f.mock->total_calls() == 0);
}

TEST_CASE("Out-of-range timeouts are rejected before dispatch", "[orchestrator]") {
    Fixture f;
    f.cfg.max_timeout_ms = 600000;
    auto orch = f.make();
    REQUIRE_THROWS_AS(orch.run(brief_for("brief", {"pub-a"}, {}, -5L)), InvalidRequest);
    REQUIRE_THROWS_AS(orch.run(brief_for("brief", {"pub-a"}, {}, 600001L)), InvalidRequest);
    REQUIRE_THROWS_AS(orch.run(brief_for("brief", {"pub-a"}, {}, 10000000000000L)), InvalidRequest);
    REQUIRE(f.mock->total_calls() == 0);
    REQUIRE(f.breaker.snapshot().empty());
}

TEST_CASE("Zero timeout means the configured default", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    auto r = orch.run(brief_for("brief", {"pub-a"}, {}, 0L));
    REQUIRE(r.timeout_ms == 1000);
    REQUIRE(r.outcomes[0].ok());
}

TEST_CASE("The largest allowed timeout leaves healthy agents healthy", "[orchestrator]") {
    Fixture f;
    f.cfg.max_timeout_ms = 600000;
    f.mock->script("pub-a", {milliseconds(50), items_response("pub-a", 2), false});
    auto orch = f.make();
    auto r = orch.run(brief_for("brief", {"pub-a"}, {}, 600000L));
    REQUIRE(r.timeout_ms == 600000);
    REQUIRE(r.outcomes[0].ok());
    REQUIRE(r.outcomes[0].items.size() == 2);
    REQUIRE(f.breaker.consecutive_failures("internal:pub-a") == 0);
}

TEST_CASE("Unknown tenant sits beside a valid one", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    auto r = orch.run(brief_for("sports campaign", {"ghost-pub", "pub-a"}));

    REQUIRE(r.total_agents == 2);
    REQUIRE(r.outcomes[0].target.key == "ghost-pub");
    REQUIRE(r.outcomes[0].error->type == "invalid_request");
    REQUIRE(r.outcomes[0].error->status == 404);
    REQUIRE(r.outcomes[1].ok());
    REQUIRE(f.mock->calls("ghost-pub") == 0);
    REQUIRE(f.mock->calls("pub-a") == 1);
}

TEST_CASE("Empty selection yields an empty result", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    auto r = orch.run(brief_for("brief", {}));
    REQUIRE(r.total_agents == 0);
    REQUIRE(r.outcomes.empty());
    REQUIRE_FALSE(r.context_id.empty());
}

TEST_CASE("Repeated identical requests produce identical outcomes", "[orchestrator]") {
    Fixture f(1000);
    f.registry.add_tenant("pub-c");
    f.mock->script("pub-a", {milliseconds(60), items_response("pub-a", 3), false});
    f.mock->script("pub-b", {milliseconds(0), error_response("ai_request_error", "upstream 500", 502), false});
    f.mock->script("pub-c", {milliseconds(30), items_response("pub-c", 1), false});
    f.mock->script("http://ext.test/rank", {milliseconds(10), items_response("ext", 2), false});
    auto orch = f.make();

    auto req = brief_for("brief", {"pub-a", "pub-b", "pub-c"}, {"http://ext.test/rank"});
    auto first = orch.run(req);
    for (int round = 0; round < 5; ++round) {
        auto again = orch.run(req);
        REQUIRE(again.outcomes.size() == first.outcomes.size());
        for (std::size_t i = 0; i < first.outcomes.size(); ++i) {
            const auto& a = first.outcomes[i];
            const auto& b = again.outcomes[i];
            REQUIRE(a.target.key == b.target.key);
            REQUIRE(a.ok() == b.ok());
            REQUIRE(a.items.size() == b.items.size());
            for (std::size_t k = 0; k < a.items.size(); ++k) REQUIRE(a.items[k].product_id == b.items[k].product_id);
            if (!a.ok()) REQUIRE(a.error->type == b.error->type);
        }
    }
}

TEST_CASE("Repeated failures open the breaker across requests", "[orchestrator]") {
    Fixture f;
    f.mock->script("pub-a", {milliseconds(0), error_response("timeout", "Request timed out after 1000ms", 408), false});
    auto orch = f.make();

    for (int i = 0; i < 3; ++i) {
        auto r = orch.run(brief_for("brief", {"pub-a"}));
        REQUIRE(r.outcomes[0].error->type == "timeout");
    }
    auto skipped = orch.run(brief_for("brief", {"pub-a"}));
    REQUIRE(skipped.outcomes[0].error->type == "circuit_open");
    REQUIRE(f.mock->calls("pub-a") == 3);
}

TEST_CASE("A success between failures keeps the breaker closed", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    f.mock->script("pub-a", {milliseconds(0), error_response("timeout", "t", 408), false});
    orch.run(brief_for("brief", {"pub-a"}));
    orch.run(brief_for("brief", {"pub-a"}));
    f.mock->script("pub-a", {milliseconds(0), items_response("pub-a", 1), false});
    REQUIRE(orch.run(brief_for("brief", {"pub-a"})).outcomes[0].ok());
    f.mock->script("pub-a", {milliseconds(0), error_response("timeout", "t", 408), false});
    REQUIRE(orch.run(brief_for("brief", {"pub-a"})).outcomes[0].error->type == "timeout");
    REQUIRE(f.breaker.state("internal:pub-a") == BreakerState::Closed);
}

TEST_CASE("Context id is a fresh UUID per request", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    auto a = orch.run(brief_for("brief", {"pub-a"}));
    auto b = orch.run(brief_for("brief", {"pub-a"}));
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    REQUIRE(std::regex_match(a.context_id, uuid));
    REQUIRE(a.context_id != b.context_id);
}

TEST_CASE("Brief is trimmed and the default timeout applies", "[orchestrator]") {
    Fixture f;
    auto orch = f.make();
    auto r = orch.run(brief_for("  sports campaign \n", {"pub-a"}));
    REQUIRE(f.mock->last_brief() == "sports campaign");
    REQUIRE(r.timeout_ms == 1000);
}

TEST_CASE("sort_by_score orders items within each agent", "[orchestrator]") {
    Fixture f;
    RankResponse resp;
    resp.items = {RankedItem{"low", "r", 0.2}, RankedItem{"none", "r", std::nullopt}, RankedItem{"high", "r", 0.95}};
    f.mock->script("pub-a", {milliseconds(0), resp, false});
    auto orch = f.make();

    auto req = brief_for("brief", {"pub-a"});
    REQUIRE(orch.run(req).outcomes[0].items[0].product_id == "low");
    req.sort_by_score = true;
    auto sorted = orch.run(req).outcomes[0].items;
    REQUIRE(sorted[0].product_id == "high");
    REQUIRE(sorted[1].product_id == "low");
    REQUIRE(sorted[2].product_id == "none");
}

#include <catch2/catch_test_macros.hpp>
#include "../include/orchestrator.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http.hpp"
#include "../../../shared/cpp/adcp_sdk/include/http_server.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <thread>

using json = nlohmann::json;
using namespace std::chrono;

namespace {
// Stand-in for the loopback service and a couple of third-party agents.
struct AgentStub {
    std::mutex mtx;
    json last_request;
    std::string last_path;

    HttpReply operator()(const HttpRequest& req) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            last_path = req.path;
            last_request = json::parse(req.body, nullptr, false);
        }
        if (req.path == "/mcp/agents/pub-a/rank") {
            return {200, R"({"items":[{"product_id":"pa_1","reason":"sports","score":0.8},{"product_id":"pa_2","reason":"outdoor","score":null}]})"};
        }
        if (req.path == "/mcp/agents/pub-empty/rank") {
            return {422, R"({"error":{"type":"no_products","message":"No products available","status":422}})"};
        }
        if (req.path == "/mcp/agents/pub-gone/rank") return {404, "not here", "text/plain"};
        if (req.path == "/ext/ok") return {200, R"({"items":[{"product_id":"x_1","reason":"fit","score":1.7}],"extra":true})"};
        if (req.path == "/ext/broken") return {503, "upstream down", "text/plain"};
        if (req.path == "/ext/garbage") return {200, "<html>not json</html>", "text/html"};
        if (req.path == "/ext/shape") return {200, R"({"products":[]})"};
        if (req.path == "/ext/slow") {
            std::this_thread::sleep_for(milliseconds(1500));
            return {200, R"({"items":[]})"};
        }
        return {404, R"({"error":"not found"})"};
    }
};

struct StubServer {
    std::shared_ptr<AgentStub> stub = std::make_shared<AgentStub>();
    HttpServer server{[s = stub](const HttpRequest& r) { return (*s)(r); }};

    StubServer() {
        http_global_init();
        REQUIRE(server.start(0));
    }
    ~StubServer() { server.stop(); }

    AgentTarget external(const std::string& path) const {
        std::string url = server.base_url() + path;
        return AgentTarget{AgentKind::External, url, url};
    }

    AgentTarget internal(const std::string& slug) const {
        return AgentTarget{AgentKind::Internal, slug, server.base_url() + "/mcp/agents/" + slug + "/rank"};
    }
};

Deadline in(milliseconds ms) { return steady_clock::now() + ms; }
}

TEST_CASE("Internal transport posts the brief to the tenant endpoint", "[transport]") {
    StubServer s;
    InternalAgentTransport t;

    auto r = t.rank(s.internal("pub-a"), "sports campaign", in(milliseconds(2000)), std::string("ctx-1"));
    REQUIRE_FALSE(r.error);
    REQUIRE(r.items.size() == 2);
    REQUIRE(r.items[0].product_id == "pa_1");
    REQUIRE(r.items[0].score == 0.8);
    REQUIRE_FALSE(r.items[1].score);

    std::lock_guard<std::mutex> lock(s.stub->mtx);
    REQUIRE(s.stub->last_path == "/mcp/agents/pub-a/rank");
    REQUIRE(s.stub->last_request["brief"] == "sports campaign");
    REQUIRE(s.stub->last_request["context_id"] == "ctx-1");
}

TEST_CASE("Internal transport maps error responses", "[transport]") {
    StubServer s;
    InternalAgentTransport t;

    SECTION("Error envelope passes through") {
        auto r = t.rank(s.internal("pub-empty"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "no_products");
        REQUIRE(r.error->message == "No products available");
        REQUIRE(r.error->status == 422);
    }
    SECTION("Bare 404 becomes invalid_request") {
        auto r = t.rank(s.internal("pub-gone"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "invalid_request");
        REQUIRE(r.error->status == 404);
    }
}

TEST_CASE("Internal transport posts to the resolved endpoint", "[transport]") {
    StubServer s;
    InternalAgentTransport t;

    SECTION("Endpoint wins over the tenant key") {
        AgentTarget target{AgentKind::Internal, "renamed-tenant", s.server.base_url() + "/mcp/agents/pub-a/rank"};
        auto r = t.rank(target, "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE_FALSE(r.error);
        REQUIRE(r.items.size() == 2);
        std::lock_guard<std::mutex> lock(s.stub->mtx);
        REQUIRE(s.stub->last_path == "/mcp/agents/pub-a/rank");
    }
    SECTION("Resolver endpoints reach the loopback service") {
        InMemoryAgentRegistry registry;
        registry.add_tenant("pub-a");
        AgentResolver resolver(registry, s.server.base_url() + "/");
        AgentSelection sel;
        sel.internal_slugs = {"pub-a"};
        auto targets = resolver.resolve(sel);
        REQUIRE(targets.size() == 1);
        auto r = t.rank(targets[0].target, "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE_FALSE(r.error);
        REQUIRE(r.items[0].product_id == "pa_1");
    }
    SECTION("Missing endpoint is an internal error, not a network call") {
        auto r = t.rank(AgentTarget{AgentKind::Internal, "pub-a", ""}, "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "internal");
    }
}

TEST_CASE("External transport validates the contract", "[transport]") {
    StubServer s;
    ExternalAgentTransport t;

    SECTION("Valid body with extra fields, score clamped") {
        auto r = t.rank(s.external("/ext/ok"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE_FALSE(r.error);
        REQUIRE(r.items.size() == 1);
        REQUIRE(r.items[0].score == 1.0);
    }
    SECTION("Non-2xx without an envelope") {
        auto r = t.rank(s.external("/ext/broken"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "ai_request_error");
        REQUIRE(r.error->status == 503);
        REQUIRE(r.error->message.find("upstream down") != std::string::npos);
    }
    SECTION("Malformed JSON") {
        auto r = t.rank(s.external("/ext/garbage"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "invalid_response");
    }
    SECTION("Wrong shape") {
        auto r = t.rank(s.external("/ext/shape"), "b", in(milliseconds(2000)), std::nullopt);
        REQUIRE(r.error);
        REQUIRE(r.error->type == "invalid_response");
    }
}

TEST_CASE("Transport gives up at the deadline", "[transport]") {
    StubServer s;
    ExternalAgentTransport t;

    auto start = steady_clock::now();
    auto r = t.rank(s.external("/ext/slow"), "b", in(milliseconds(300)), std::nullopt);
    auto elapsed = steady_clock::now() - start;

    REQUIRE(r.error);
    REQUIRE(r.error->type == "timeout");
    REQUIRE(r.error->message.find("Request timed out after") == 0);
    REQUIRE(elapsed < milliseconds(1200));
}

TEST_CASE("Expired deadline never touches the network", "[transport]") {
    ExternalAgentTransport t;
    AgentTarget target{AgentKind::External, "http://127.0.0.1:1/rank", "http://127.0.0.1:1/rank"};
    auto r = t.rank(target, "b", steady_clock::now() - milliseconds(1), std::nullopt);
    REQUIRE(r.error);
    REQUIRE(r.error->type == "timeout");
}

TEST_CASE("Unreachable agent is a request error", "[transport]") {
    http_global_init();
    ExternalAgentTransport t;
    AgentTarget target{AgentKind::External, "http://127.0.0.1:1/rank", "http://127.0.0.1:1/rank"};
    auto r = t.rank(target, "b", in(milliseconds(2000)), std::nullopt);
    REQUIRE(r.error);
    REQUIRE(r.error->type == "ai_request_error");
}

TEST_CASE("Orchestrator over HTTP mixes internal and external agents", "[transport][orchestrator]") {
    StubServer s;
    OrchestratorConfig cfg;
    cfg.service_base_url = s.server.base_url();
    cfg.default_timeout_ms = 500;
    cfg.concurrency = 4;

    InMemoryAgentRegistry registry;
    registry.add_tenant("pub-a");
    registry.add_tenant("pub-empty");
    CircuitBreakerRegistry breaker(3, seconds(60));
    auto router = std::make_shared<TransportRouter>(
        std::make_shared<InternalAgentTransport>(),
        std::make_shared<ExternalAgentTransport>());
    Orchestrator orch(cfg, registry, breaker, router);

    BriefRequest req;
    req.brief = "sports campaign";
    req.selection.internal_slugs = {"pub-a", "pub-empty"};
    req.selection.external_urls = {s.server.base_url() + "/ext/ok", s.server.base_url() + "/ext/slow"};

    auto start = steady_clock::now();
    auto result = orch.run(req);
    REQUIRE(steady_clock::now() - start < milliseconds(1300));

    REQUIRE(result.total_agents == 4);
    REQUIRE(result.outcomes[0].ok());
    REQUIRE(result.outcomes[0].items.size() == 2);
    REQUIRE(result.outcomes[1].error->type == "no_products");
    REQUIRE(result.outcomes[2].ok());
    REQUIRE(result.outcomes[3].error->type == "timeout");
    REQUIRE(breaker.consecutive_failures("internal:pub-empty") == 1);
    REQUIRE(breaker.consecutive_failures("external:" + s.server.base_url() + "/ext/slow") == 1);
}

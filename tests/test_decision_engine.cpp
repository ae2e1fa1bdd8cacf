#include <catch2/catch_test_macros.hpp>
#include "core/decision_engine.hpp"
#include "mocks/mock_scoring_client.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <stdexcept>

using namespace rbagate;
using namespace rbagate::testing;
using namespace std::chrono_literals;

namespace {

struct EngineHarness {
    std::shared_ptr<DenialCache> cache = std::make_shared<DenialCache>();
    std::shared_ptr<MockScoringClient> scoring = std::make_shared<MockScoringClient>(0.1);
    std::unique_ptr<DecisionEngine> engine;

    explicit EngineHarness(double threshold = 0.7,
                           std::string endpoint = "https://risk.example.com/v1/score") {
        DecisionEngine::Config cfg;
        cfg.endpoint = std::move(endpoint);
        cfg.failure_threshold = threshold;
        engine = std::make_unique<DecisionEngine>(cfg, cache, scoring);
    }
};

AuthenticationContext authn_for(const std::string& principal) {
    AuthenticationContext authn;
    authn.principal = principal;
    return authn;
}

InboundRequest request_with(std::optional<std::string> metrics) {
    InboundRequest req;
    req.remote_addr = "10.0.0.1";
    req.user_agent = "Mozilla/5.0";
    req.metrics_field = std::move(metrics);
    return req;
}

} // anonymous namespace

TEST_CASE("DecisionEngine: construction requires collaborators", "[decision_engine]") {
    auto cache = std::make_shared<DenialCache>();
    auto scoring = std::make_shared<MockScoringClient>();
    DecisionEngine::Config cfg;
    cfg.endpoint = "http://localhost/score";

    CHECK_THROWS_AS(DecisionEngine(cfg, nullptr, scoring), std::invalid_argument);
    CHECK_THROWS_AS(DecisionEngine(cfg, cache, nullptr), std::invalid_argument);
}

TEST_CASE("DecisionEngine: SSO without prior denial proceeds", "[decision_engine][scenario]") {
    EngineHarness h;
    const auto authn = authn_for("alice");
    const auto req = request_with(std::nullopt);

    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::PROCEED);
    CHECK(h.scoring->call_count() == 0);
    CHECK(h.cache->size() == 0);
}

TEST_CASE("DecisionEngine: SSO ten minutes after a denial is denied", "[decision_engine][scenario]") {
    EngineHarness h;
    const auto now = DenialCache::Clock::now();
    h.cache->record_denial("alice", now - 10min);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::nullopt);

    CHECK(h.engine->evaluate(&authn, &req, now) == DecisionOutcome::DENY);
    CHECK(h.scoring->call_count() == 0);
}

TEST_CASE("DecisionEngine: SSO 61 minutes after a denial proceeds and evicts", "[decision_engine][scenario]") {
    EngineHarness h;
    const auto now = DenialCache::Clock::now();
    h.cache->record_denial("alice", now - 61min);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::nullopt);

    CHECK(h.engine->evaluate(&authn, &req, now) == DecisionOutcome::PROCEED);
    CHECK_FALSE(h.cache->last_denial("alice").has_value());
}

TEST_CASE("DecisionEngine: blank telemetry is treated as SSO", "[decision_engine]") {
    EngineHarness h;
    const auto now = DenialCache::Clock::now();
    h.cache->record_denial("alice", now);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::string("   "));

    CHECK(h.engine->evaluate(&authn, &req, now) == DecisionOutcome::DENY);
    CHECK(h.scoring->call_count() == 0);
    CHECK(h.engine->get_stats().sso_attempts == 1);
}

TEST_CASE("DecisionEngine: sanitized telemetry reaches the scoring call", "[decision_engine][scenario]") {
    EngineHarness h;
    const auto authn = authn_for("alice");
    const auto req = request_with(std::string(R"({"key_count": 99999999, "touch_support": "yes"})"));

    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::PROCEED);
    REQUIRE(h.scoring->call_count() == 1);

    const auto sent = nlohmann::json::parse(h.scoring->last_payload());
    REQUIRE(sent.contains("metrics"));
    CHECK(sent["metrics"].size() == 1);
    CHECK(sent["metrics"]["key_count"] == 10000);
    CHECK_FALSE(sent["metrics"].contains("touch_support"));
}

TEST_CASE("DecisionEngine: high score denies and blocks the next SSO attempt", "[decision_engine][scenario]") {
    EngineHarness h(0.7);
    h.scoring->set_score(0.9);
    const auto t0 = DenialCache::Clock::now();

    const auto authn = authn_for("alice");
    const auto full = request_with(std::string(R"({"key_count": 12})"));
    CHECK(h.engine->evaluate(&authn, &full, t0) == DecisionOutcome::DENY);
    CHECK(h.cache->is_currently_denied("alice", t0));

    const auto sso = request_with(std::nullopt);
    CHECK(h.engine->evaluate(&authn, &sso, t0 + 30min) == DecisionOutcome::DENY);
    CHECK(h.scoring->call_count() == 1);
}

TEST_CASE("DecisionEngine: score equal to threshold denies", "[decision_engine]") {
    EngineHarness h(0.7);
    h.scoring->set_score(0.7);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::string("{}"));
    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::DENY);
    CHECK(h.cache->is_currently_denied("alice"));
}

TEST_CASE("DecisionEngine: low score clears an earlier denial", "[decision_engine]") {
    EngineHarness h(0.7);
    h.scoring->set_score(0.2);
    const auto now = DenialCache::Clock::now();
    h.cache->record_denial("alice", now - 5min);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::string(R"({"click_count": 3})"));
    CHECK(h.engine->evaluate(&authn, &req, now) == DecisionOutcome::PROCEED);
    CHECK_FALSE(h.cache->last_denial("alice").has_value());
}

TEST_CASE("DecisionEngine: rejected telemetry denies without scoring", "[decision_engine]") {
    EngineHarness h;
    const auto authn = authn_for("alice");

    const char* bad_payloads[] = {"[1,2]", "{not json", "42", "null"};
    for (const auto* p : bad_payloads) {
        INFO(p);
        h.cache->clear("alice");
        const auto req = request_with(std::string(p));
        CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::DENY);
        CHECK(h.cache->is_currently_denied("alice"));
    }

    const auto huge = request_with(R"({"device_uuid":")" + std::string(9000, 'a') + "\"}");
    h.cache->clear("alice");
    CHECK(h.engine->evaluate(&authn, &huge) == DecisionOutcome::DENY);
    CHECK(h.cache->is_currently_denied("alice"));

    CHECK(h.scoring->call_count() == 0);
}

TEST_CASE("DecisionEngine: missing inputs are errors", "[decision_engine]") {

    SECTION("No authentication context") {
        EngineHarness h;
        const auto req = request_with(std::nullopt);
        CHECK(h.engine->evaluate(nullptr, &req) == DecisionOutcome::ERROR);
    }

    SECTION("No inbound request") {
        EngineHarness h;
        const auto authn = authn_for("alice");
        CHECK(h.engine->evaluate(&authn, nullptr) == DecisionOutcome::ERROR);
    }

    SECTION("Blank endpoint") {
        EngineHarness h(0.7, "  ");
        const auto authn = authn_for("alice");
        const auto req = request_with(std::string(R"({"key_count": 1})"));
        CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::ERROR);
        CHECK(h.scoring->call_count() == 0);
        CHECK(h.cache->size() == 0);
    }
}

TEST_CASE("DecisionEngine: scoring failures are errors and leave the cache alone", "[decision_engine]") {
    EngineHarness h;
    const auto now = DenialCache::Clock::now();
    h.cache->record_denial("bob", now - 1min);

    const auto authn_alice = authn_for("alice");
    const auto authn_bob = authn_for("bob");
    const auto req = request_with(std::string(R"({"key_count": 1})"));

    SECTION("Transport failure") {
        h.scoring->set_error(ErrorCategory::TRANSPORT_ERROR, "connect timeout");
        CHECK(h.engine->evaluate(&authn_alice, &req, now) == DecisionOutcome::ERROR);
        CHECK(h.engine->evaluate(&authn_bob, &req, now) == DecisionOutcome::ERROR);
    }

    SECTION("Protocol failure") {
        h.scoring->set_error(ErrorCategory::PROTOCOL_ERROR, "missing threatScore");
        CHECK(h.engine->evaluate(&authn_alice, &req, now) == DecisionOutcome::ERROR);
        CHECK(h.engine->evaluate(&authn_bob, &req, now) == DecisionOutcome::ERROR);
    }

    SECTION("Non-finite score") {
        h.scoring->set_score(std::numeric_limits<double>::quiet_NaN());
        CHECK(h.engine->evaluate(&authn_alice, &req, now) == DecisionOutcome::ERROR);
        h.scoring->set_score(std::numeric_limits<double>::infinity());
        CHECK(h.engine->evaluate(&authn_bob, &req, now) == DecisionOutcome::ERROR);
    }

    CHECK_FALSE(h.cache->last_denial("alice").has_value());
    CHECK(h.cache->is_currently_denied("bob", now));
}

TEST_CASE("DecisionEngine: oversized scoring payload is an error", "[decision_engine]") {
    auto cache = std::make_shared<DenialCache>();
    auto scoring = std::make_shared<MockScoringClient>(0.1);
    DecisionEngine::Config cfg;
    cfg.endpoint = "http://localhost/score";
    cfg.failure_threshold = 0.7;
    cfg.max_payload_bytes = 128;
    DecisionEngine engine(cfg, cache, scoring);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::string(R"({"device_uuid":")" + std::string(200, 'u') + "\"}"));

    CHECK(engine.evaluate(&authn, &req) == DecisionOutcome::ERROR);
    CHECK(scoring->call_count() == 0);
    CHECK(cache->size() == 0);
}

TEST_CASE("DecisionEngine: payload carries sanitized identity and context", "[decision_engine]") {
    EngineHarness h;

    const auto authn = authn_for(" alice\n");
    InboundRequest req;
    req.remote_addr = "10.0.0.1";
    req.forwarded_for = "203.0.113.9, 10.0.0.1";
    req.user_agent = "Mozilla/5.0\r\nX-Evil: 1";
    req.metrics_field = R"({"language":"en-US","password":"hunter2"})";

    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::PROCEED);

    const auto& payload = h.scoring->last_payload();
    CHECK(payload.starts_with(R"({"username":"alice","ipAddress":"203.0.113.9","userAgent":)"));

    const auto sent = nlohmann::json::parse(payload);
    CHECK(sent["userAgent"] == "Mozilla/5.0X-Evil: 1");
    CHECK(sent["metrics"] == nlohmann::json{{"language", "en-US"}});
    CHECK(payload.find("hunter2") == std::string::npos);

    // Cache key is the unsanitized principal
    h.scoring->set_score(0.95);
    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::DENY);
    CHECK(h.cache->is_currently_denied(" alice\n"));
    CHECK_FALSE(h.cache->is_currently_denied("alice"));
}

TEST_CASE("DecisionEngine: absent principal is still evaluated", "[decision_engine]") {
    EngineHarness h;
    h.scoring->set_score(0.99);

    const AuthenticationContext anonymous{};
    const auto req = request_with(std::string(R"({"key_count": 1})"));

    CHECK(h.engine->evaluate(&anonymous, &req) == DecisionOutcome::DENY);
    const auto sent = nlohmann::json::parse(h.scoring->last_payload());
    CHECK(sent["username"] == "");
    CHECK(h.cache->is_currently_denied(""));
}

TEST_CASE("DecisionEngine: outcome counters", "[decision_engine]") {
    EngineHarness h;
    const auto authn = authn_for("alice");
    const auto sso = request_with(std::nullopt);
    const auto bad = request_with(std::string("[]"));

    (void)h.engine->evaluate(&authn, &sso);      // proceed
    (void)h.engine->evaluate(&authn, &bad);      // deny
    (void)h.engine->evaluate(nullptr, &sso);     // error

    const auto stats = h.engine->get_stats();
    CHECK(stats.total == 3);
    CHECK(stats.proceeded == 1);
    CHECK(stats.denied == 1);
    CHECK(stats.errors == 1);
    CHECK(stats.sso_attempts == 1);
    CHECK(stats.validator.rejected == 1);
}

TEST_CASE("DecisionEngine: overflowing literal in telemetry does not deny", "[decision_engine]") {
    EngineHarness h(0.7);
    h.scoring->set_score(0.1);

    const auto authn = authn_for("alice");
    const auto req = request_with(std::string(R"({"key_count": 5, "unlisted": 1e400})"));

    CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::PROCEED);
    REQUIRE(h.scoring->call_count() == 1);
    CHECK(h.cache->size() == 0);

    const auto sent = nlohmann::json::parse(h.scoring->last_payload());
    CHECK(sent["metrics"] == nlohmann::json{{"key_count", 5}});
}

TEST_CASE("DecisionEngine: telemetry of Unicode spaces is treated as SSO", "[decision_engine]") {
    EngineHarness h;
    const auto authn = authn_for("alice");
    // U+2003 EM SPACE, U+3000 IDEOGRAPHIC SPACE, tab
    const auto req = request_with(std::string("\xE2\x80\x83\t\xE3\x80\x80"));

    SECTION("No prior denial proceeds") {
        CHECK(h.engine->evaluate(&authn, &req) == DecisionOutcome::PROCEED);
        CHECK(h.cache->size() == 0);
    }

    SECTION("Prior denial blocks") {
        const auto now = DenialCache::Clock::now();
        h.cache->record_denial("alice", now - 5min);
        CHECK(h.engine->evaluate(&authn, &req, now) == DecisionOutcome::DENY);
    }

    CHECK(h.scoring->call_count() == 0);
    CHECK(h.engine->get_stats().sso_attempts == 1);
    CHECK(h.engine->get_stats().validator.rejected == 0);
}

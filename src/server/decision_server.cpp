#include "server/decision_server.hpp"
#include "server/http_constants.hpp"
#include "core/decision_engine.hpp"
#include "core/utils.hpp"
#include "security/denial_cache.hpp"
#include "scoring/http_scoring_client.hpp"

// cpp-httplib is header-only — suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace rbagate {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

/// Copy an optional string member; false when present with a non-string type
bool read_optional_string(const nlohmann::json& obj, const char* key,
                          std::optional<std::string>& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

DecisionServer::DecisionServer(Config config,
                               std::shared_ptr<DecisionEngine> engine,
                               std::shared_ptr<DenialCache> denial_cache,
                               std::shared_ptr<HttpScoringClient> scoring_client)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      denial_cache_(std::move(denial_cache)),
      scoring_client_(std::move(scoring_client)),
      server_(std::make_unique<httplib::Server>()) {
    if (!engine_) {
        throw std::invalid_argument("DecisionServer requires a DecisionEngine");
    }
}

DecisionServer::~DecisionServer() = default;

// ============================================================================
// Request mapping
// ============================================================================

std::optional<DecisionServer::DecideRequest> DecisionServer::parse_decide_body(
    const std::string& body, const std::string& peer_addr) {
    const auto json = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    DecideRequest out;

    bool authenticated = false;
    if (const auto it = json.find("authenticated"); it != json.end() && !it->is_null()) {
        if (!it->is_boolean()) return std::nullopt;
        authenticated = it->get<bool>();
    }
    if (authenticated) {
        AuthenticationContext authn;
        if (!read_optional_string(json, "principal", authn.principal)) return std::nullopt;
        out.authn = std::move(authn);
    }

    std::optional<std::string> remote_addr;
    if (!read_optional_string(json, "remote_addr", remote_addr) ||
        !read_optional_string(json, "forwarded_for", out.request.forwarded_for) ||
        !read_optional_string(json, "user_agent", out.request.user_agent) ||
        !read_optional_string(json, "metrics", out.request.metrics_field)) {
        return std::nullopt;
    }
    out.request.remote_addr = remote_addr.value_or(peer_addr);

    return out;
}

std::string DecisionServer::outcome_body(DecisionOutcome outcome) {
    return std::format(R"({{"outcome":"{}"}})", outcome_to_string(outcome));
}

std::string DecisionServer::stats_body() const {
    nlohmann::json stats = nlohmann::json::object();

    const auto engine = engine_->get_stats();
    stats["decisions"] = {
        {"total", engine.total},
        {"proceed", engine.proceeded},
        {"deny", engine.denied},
        {"error", engine.errors},
        {"sso_attempts", engine.sso_attempts},
        {"bad_requests", bad_requests_.load(std::memory_order_relaxed)}
    };
    stats["validator"] = {
        {"validated", engine.validator.validated},
        {"rejected", engine.validator.rejected},
        {"fields_dropped", engine.validator.fields_dropped}
    };

    if (denial_cache_) {
        stats["denial_cache"] = {
            {"entries", denial_cache_->size()},
            {"ttl_seconds", denial_cache_->ttl().count()},
            {"total_denials", denial_cache_->total_denials()},
            {"total_blocks", denial_cache_->total_blocks()},
            {"total_expired", denial_cache_->total_expired()}
        };
    }

    if (scoring_client_) {
        const auto scoring = scoring_client_->get_stats();
        stats["scoring"] = {
            {"calls", scoring.calls},
            {"transport_errors", scoring.transport_errors},
            {"http_errors", scoring.http_errors},
            {"protocol_errors", scoring.protocol_errors}
        };
    }

    return stats.dump();
}

// ============================================================================
// start() — registers routes, listens
// ============================================================================

void DecisionServer::start() {
    auto& svr = *server_;

    const size_t pool_size = config_.threads;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_request_bytes);

    svr.Post("/v1/decide", [this](const httplib::Request& req, httplib::Response& res) {
        handle_decide(req, res);
    });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/v1/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    utils::log::info(std::format("Starting RBA decision service on {}:{} ({} threads)",
        config_.host, config_.port, config_.threads));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}",
                                             config_.host, config_.port));
    }
}

void DecisionServer::stop() {
    server_->stop();
    utils::log::info("Server stopped");
}

// ============================================================================
// Handlers
// ============================================================================

void DecisionServer::handle_decide(const httplib::Request& req, httplib::Response& res) {
    const auto parsed = parse_decide_body(req.body, req.remote_addr);
    if (!parsed) {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
        res.status = httplib::StatusCode::BadRequest_400;
        res.set_content(R"({"error":"Body must be a JSON object with string fields"})",
                        http::kJsonContentType);
        return;
    }

    const auto outcome = engine_->evaluate(
        parsed->authn ? &*parsed->authn : nullptr, &parsed->request);
    res.set_content(outcome_body(outcome), http::kJsonContentType);
}

void DecisionServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(R"({"status":"healthy","service":"rba-gate"})", http::kJsonContentType);
}

void DecisionServer::handle_stats(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(stats_body(), http::kJsonContentType);
}

} // namespace rbagate

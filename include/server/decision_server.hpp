#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace rbagate {

class DecisionEngine;
class DenialCache;
class HttpScoringClient;

/**
 * @brief Loopback HTTP surface the identity provider calls once per login.
 *
 * Routes:
 * - POST /v1/decide  -> {"outcome":"proceed"|"deny"|"error"}
 * - GET  /health     -> liveness
 * - GET  /v1/stats   -> engine, validator, denial cache and scoring counters
 *
 * Deny and Error stay distinct in the response; the caller decides whether to
 * present them differently.
 */
class DecisionServer {
public:
    struct Config {
        std::string host = "127.0.0.1";
        int port = 8089;
        size_t threads = 8;
        size_t max_request_bytes = 64 * 1024;
    };

    /// A /v1/decide body mapped onto the engine's inputs
    struct DecideRequest {
        std::optional<AuthenticationContext> authn;
        InboundRequest request;
    };

    DecisionServer(Config config,
                   std::shared_ptr<DecisionEngine> engine,
                   std::shared_ptr<DenialCache> denial_cache,
                   std::shared_ptr<HttpScoringClient> scoring_client = nullptr);
    ~DecisionServer();

    /// Blocks until stop() is called or listening fails (throws std::runtime_error)
    void start();
    void stop();

    /**
     * @brief Map a /v1/decide JSON body onto engine inputs
     * @param body Request body
     * @param peer_addr Connection peer, used when the body has no remote_addr
     * @return nullopt when the body is not a JSON object or a field has the wrong type
     */
    [[nodiscard]] static std::optional<DecideRequest> parse_decide_body(
        const std::string& body, const std::string& peer_addr);

    [[nodiscard]] static std::string outcome_body(DecisionOutcome outcome);

    [[nodiscard]] std::string stats_body() const;

private:
    void handle_decide(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);

    Config config_;
    std::shared_ptr<DecisionEngine> engine_;
    std::shared_ptr<DenialCache> denial_cache_;
    std::shared_ptr<HttpScoringClient> scoring_client_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<uint64_t> bad_requests_{0};
};

} // namespace rbagate

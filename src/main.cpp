#include "core/decision_engine.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "scoring/http_scoring_client.hpp"
#include "security/denial_cache.hpp"
#include "server/decision_server.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace rbagate;

// Global instance for signal handling
std::shared_ptr<DecisionServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("RBA Gate starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/rba_gate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/4] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const GateConfig& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/4] Denial cache
        // =====================================================================
        DenialCache::Config cache_config;
        cache_config.ttl = std::chrono::seconds{config.denial_cache.ttl_seconds};
        auto denial_cache = std::make_shared<DenialCache>(cache_config);
        utils::log::info(std::format("[2/4] Denial cache: ttl={}s", cache_config.ttl.count()));

        // =====================================================================
        // [3/4] Scoring client + decision engine
        // =====================================================================
        HttpScoringClient::Config scoring_config;
        scoring_config.endpoint = config.scoring.endpoint;
        // Integer settings were range-checked by ConfigLoader::validate_config
        scoring_config.connect_timeout_ms = static_cast<uint32_t>(config.scoring.connect_timeout_ms);
        scoring_config.read_timeout_ms = static_cast<uint32_t>(config.scoring.read_timeout_ms);
        auto scoring_client = std::make_shared<HttpScoringClient>(scoring_config);

        DecisionEngine::Config engine_config;
        engine_config.endpoint = config.scoring.endpoint;
        engine_config.failure_threshold = config.scoring.failure_threshold;
        engine_config.max_payload_bytes = static_cast<size_t>(config.scoring.max_payload_bytes);
        auto engine = std::make_shared<DecisionEngine>(engine_config, denial_cache, scoring_client);

        utils::log::info(std::format("[3/4] Scoring: endpoint={}, threshold={}, timeouts={}ms/{}ms",
            config.scoring.endpoint, config.scoring.failure_threshold,
            scoring_config.connect_timeout_ms, scoring_config.read_timeout_ms));

        // =====================================================================
        // [4/4] Decision server
        // =====================================================================
        DecisionServer::Config server_config;
        server_config.host = config.server.host;
        server_config.port = static_cast<int>(config.server.port);
        server_config.threads = static_cast<size_t>(config.server.threads);
        server_config.max_request_bytes = static_cast<size_t>(config.server.max_request_bytes);

        g_server = std::make_shared<DecisionServer>(
            server_config, engine, denial_cache, scoring_client);

        utils::log::info(std::format("[4/4] Server ready on http://{}:{}",
            server_config.host, server_config.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}

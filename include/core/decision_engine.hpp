#pragma once

#include "core/types.hpp"
#include "security/denial_cache.hpp"
#include "security/metrics_validator.hpp"
#include "scoring/iscoring_client.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace rbagate {

/**
 * @brief Turns one login attempt into Proceed, Deny or Error.
 *
 * Missing authentication context, missing inbound request or an unconfigured
 * endpoint is an Error. Without telemetry (an SSO attempt) the outcome is
 * Deny only when the principal has a live denial, otherwise Proceed. With
 * telemetry the payload is validated (rejected telemetry is a Deny and marks
 * the principal denied), scored, and compared with the failure threshold:
 * score < threshold clears the principal and proceeds, anything else records
 * a denial. Scoring failures are Errors and leave the cache untouched.
 *
 * The engine holds no per-request state and may be shared across threads.
 */
class DecisionEngine {
public:
    struct Config {
        std::string endpoint;           // Only checked for presence; the client owns the URL
        double failure_threshold = 0.0;
        size_t max_payload_bytes = 64 * 1024;
    };

    DecisionEngine(Config config,
                   std::shared_ptr<DenialCache> denial_cache,
                   std::shared_ptr<IScoringClient> scoring_client);

    [[nodiscard]] DecisionOutcome evaluate(const AuthenticationContext* authn,
                                           const InboundRequest* request);

    [[nodiscard]] DecisionOutcome evaluate(const AuthenticationContext* authn,
                                           const InboundRequest* request,
                                           DenialCache::Clock::time_point now);

    /// Serialized {username, ipAddress, userAgent, metrics} object
    [[nodiscard]] static std::string build_payload(const std::string& username,
                                                   const std::string& ip_address,
                                                   const std::string& user_agent,
                                                   const SanitizedMetrics& metrics);

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t total = 0;
        uint64_t proceeded = 0;
        uint64_t denied = 0;
        uint64_t errors = 0;
        uint64_t sso_attempts = 0;
        SchemaValidator::Stats validator;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    DecisionOutcome evaluate_sso(const std::string& principal,
                                 const std::string& display_name,
                                 DenialCache::Clock::time_point now);

    DecisionOutcome evaluate_telemetry(const std::string& principal,
                                       const std::string& display_name,
                                       const std::string& ip_address,
                                       const InboundRequest& request,
                                       DenialCache::Clock::time_point now);

    DecisionOutcome emit(DecisionOutcome outcome);

    Config config_;
    std::shared_ptr<DenialCache> denial_cache_;
    std::shared_ptr<IScoringClient> scoring_client_;
    SchemaValidator validator_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> proceeded_{0};
    std::atomic<uint64_t> denied_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> sso_attempts_{0};
};

} // namespace rbagate

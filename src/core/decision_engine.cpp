#include "core/decision_engine.hpp"
#include "core/client_ip.hpp"
#include "core/utils.hpp"
#include "security/sanitizer.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <format>
#include <stdexcept>

namespace rbagate {

DecisionEngine::DecisionEngine(Config config,
                               std::shared_ptr<DenialCache> denial_cache,
                               std::shared_ptr<IScoringClient> scoring_client)
    : config_(std::move(config)),
      denial_cache_(std::move(denial_cache)),
      scoring_client_(std::move(scoring_client)) {
    if (!denial_cache_) {
        throw std::invalid_argument("DecisionEngine requires a DenialCache");
    }
    if (!scoring_client_) {
        throw std::invalid_argument("DecisionEngine requires a scoring client");
    }
}

DecisionOutcome DecisionEngine::evaluate(const AuthenticationContext* authn,
                                         const InboundRequest* request) {
    return evaluate(authn, request, DenialCache::Clock::now());
}

DecisionOutcome DecisionEngine::evaluate(const AuthenticationContext* authn,
                                         const InboundRequest* request,
                                         DenialCache::Clock::time_point now) {
    total_.fetch_add(1, std::memory_order_relaxed);

    if (!authn) {
        utils::log::error("Authentication context is not available");
        return emit(DecisionOutcome::ERROR);
    }

    if (utils::is_blank(config_.endpoint)) {
        utils::log::error("Scoring endpoint is not configured");
        return emit(DecisionOutcome::ERROR);
    }

    if (!request) {
        utils::log::error("Inbound request is not available");
        return emit(DecisionOutcome::ERROR);
    }

    // Cache key is the principal as given (case-sensitive); everything that
    // reaches a payload or log line is sanitized.
    const std::string principal = authn->principal.value_or("");
    const std::string username = Sanitizer::sanitize(authn->principal);
    const std::string ip_address = extract_client_ip(request->remote_addr, request->forwarded_for);

    utils::log::info(std::format("Starting RBA check for user='{}', ip='{}'", username, ip_address));

    if (!request->metrics_field || Sanitizer::is_blank(*request->metrics_field)) {
        return evaluate_sso(principal, username, now);
    }

    if (utils::log::enabled(utils::log::Level::DEBUG)) {
        utils::log::debug(std::format("{} raw={}", kMetricsParameter,
                                      Sanitizer::mask_for_log(*request->metrics_field)));
    }
    return evaluate_telemetry(principal, username, ip_address, *request, now);
}

DecisionOutcome DecisionEngine::evaluate_sso(const std::string& principal,
                                             const std::string& display_name,
                                             DenialCache::Clock::time_point now) {
    sso_attempts_.fetch_add(1, std::memory_order_relaxed);

    if (denial_cache_->is_currently_denied(principal, now)) {
        utils::log::warn(std::format(
            "SSO attempt by previously denied user '{}' - blocking", display_name));
        return emit(DecisionOutcome::DENY);
    }

    utils::log::info(std::format(
        "SSO attempt by user '{}' with no outstanding denial - allowing", display_name));
    return emit(DecisionOutcome::PROCEED);
}

DecisionOutcome DecisionEngine::evaluate_telemetry(const std::string& principal,
                                                   const std::string& display_name,
                                                   const std::string& ip_address,
                                                   const InboundRequest& request,
                                                   DenialCache::Clock::time_point now) {
    const auto metrics = validator_.validate(*request.metrics_field);
    if (!metrics) {
        utils::log::warn(std::format(
            "Telemetry was rejected or invalid; denying access for user='{}'", display_name));
        denial_cache_->record_denial(principal, now);
        return emit(DecisionOutcome::DENY);
    }

    const auto user_agent = Sanitizer::sanitize(request.user_agent);
    const auto payload = build_payload(display_name, ip_address, user_agent, *metrics);
    if (payload.size() > config_.max_payload_bytes) {
        utils::log::warn(std::format(
            "Prepared scoring payload too large ({} bytes); aborting call", payload.size()));
        return emit(DecisionOutcome::ERROR);
    }

    const auto result = scoring_client_->score(payload);
    if (result.is_error()) {
        utils::log::error(std::format("Error calling scoring service at {} [{}]: {}",
            Sanitizer::sanitize(config_.endpoint),
            error_category_to_string(result.error_category()),
            result.error_message()));
        return emit(DecisionOutcome::ERROR);
    }

    const double threat_score = result.value();
    if (!std::isfinite(threat_score)) {
        utils::log::error(std::format("Scoring client '{}' returned a non-finite score",
                                      scoring_client_->name()));
        return emit(DecisionOutcome::ERROR);
    }

    utils::log::info(std::format("RBA score={}, threshold={}",
                                 threat_score, config_.failure_threshold));

    if (threat_score < config_.failure_threshold) {
        denial_cache_->clear(principal);
        utils::log::info(std::format("User '{}' passed RBA check - allowing", display_name));
        return emit(DecisionOutcome::PROCEED);
    }

    denial_cache_->record_denial(principal, now);
    utils::log::warn(std::format(
        "Login denied by RBA: threatScore {} >= threshold {}. User '{}' blocked for {}s",
        threat_score, config_.failure_threshold, display_name, denial_cache_->ttl().count()));
    return emit(DecisionOutcome::DENY);
}

std::string DecisionEngine::build_payload(const std::string& username,
                                          const std::string& ip_address,
                                          const std::string& user_agent,
                                          const SanitizedMetrics& metrics) {
    nlohmann::ordered_json payload = {
        {"username", username},
        {"ipAddress", ip_address},
        {"userAgent", user_agent},
        {"metrics", metrics.json()}
    };
    return payload.dump();
}

DecisionOutcome DecisionEngine::emit(DecisionOutcome outcome) {
    switch (outcome) {
        case DecisionOutcome::PROCEED:
            proceeded_.fetch_add(1, std::memory_order_relaxed);
            break;
        case DecisionOutcome::DENY:
            denied_.fetch_add(1, std::memory_order_relaxed);
            break;
        case DecisionOutcome::ERROR:
            errors_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
    utils::log::info(std::format("RBA: emitting outcome='{}'", outcome_to_string(outcome)));
    return outcome;
}

DecisionEngine::Stats DecisionEngine::get_stats() const {
    return {
        total_.load(std::memory_order_relaxed),
        proceeded_.load(std::memory_order_relaxed),
        denied_.load(std::memory_order_relaxed),
        errors_.load(std::memory_order_relaxed),
        sso_attempts_.load(std::memory_order_relaxed),
        validator_.get_stats()
    };
}

} // namespace rbagate

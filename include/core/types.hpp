#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rbagate {

// ============================================================================
// Decision Outcome
// ============================================================================

enum class DecisionOutcome : uint8_t {
    PROCEED,
    DENY,
    ERROR
};

[[nodiscard]] inline const char* outcome_to_string(DecisionOutcome outcome) {
    switch (outcome) {
        case DecisionOutcome::PROCEED: return "proceed";
        case DecisionOutcome::DENY:    return "deny";
        case DecisionOutcome::ERROR:   return "error";
        default:                       return "unknown";
    }
}

// ============================================================================
// Inbound context supplied by the host authentication framework
// ============================================================================

/**
 * @brief Result of the upstream authentication step.
 *
 * The principal is the first username principal of the authenticated subject.
 * It may be absent; such logins are still evaluated.
 */
struct AuthenticationContext {
    std::optional<std::string> principal;
};

/**
 * @brief Per-login view of the inbound HTTP request.
 */
struct InboundRequest {
    std::string remote_addr;                    // Transport-level peer address
    std::optional<std::string> forwarded_for;   // X-Forwarded-For header value
    std::optional<std::string> user_agent;      // User-Agent header value
    std::optional<std::string> metrics_field;   // Raw telemetry request parameter
};

// Request parameter the login form uses to submit telemetry
inline constexpr const char* kMetricsParameter = "rbaMetricsField";

} // namespace rbagate

#include "scoring/http_scoring_client.hpp"
#include "security/sanitizer.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only — suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <format>

namespace rbagate {

// ============================================================================
// Construction
// ============================================================================

HttpScoringClient::HttpScoringClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Endpoint parsing
// ============================================================================

std::optional<HttpScoringClient::EndpointParts> HttpScoringClient::split_endpoint(
    const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    const auto scheme = utils::to_lower(std::string_view(url).substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return std::nullopt;

    const auto authority_start = scheme_end + 3;
    const auto path_start = url.find_first_of("/?", authority_start);
    const auto authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    if (authority.empty() || authority.find_first_of(" @") != std::string::npos) {
        return std::nullopt;
    }

    EndpointParts parts;
    parts.scheme_host_port = scheme + "://" + authority;
    if (path_start == std::string::npos) {
        parts.path = "/";
    } else if (url[path_start] == '?') {
        parts.path = "/" + url.substr(path_start);
    } else {
        parts.path = url.substr(path_start);
    }
    return parts;
}

// ============================================================================
// Response Parsing
// ============================================================================

Result<double> HttpScoringClient::parse_score(const std::string& body) {
    const auto json = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        return Result<double>::error(ErrorCategory::PROTOCOL_ERROR,
            "Invalid JSON from scoring service");
    }

    const auto it = json.find("threatScore");
    if (it == json.end()) {
        return Result<double>::error(ErrorCategory::PROTOCOL_ERROR,
            "Scoring response missing required 'threatScore'");
    }
    if (!it->is_number()) {
        return Result<double>::error(ErrorCategory::PROTOCOL_ERROR,
            std::format("Scoring 'threatScore' is a {}, not a number", it->type_name()));
    }

    const double score = it->get<double>();
    if (!std::isfinite(score)) {
        return Result<double>::error(ErrorCategory::PROTOCOL_ERROR,
            std::format("Scoring 'threatScore' is not a finite number: {}", score));
    }
    return Result<double>::ok(score);
}

// ============================================================================
// API Call
// ============================================================================

Result<double> HttpScoringClient::score(const std::string& payload_json) {
    calls_.fetch_add(1, std::memory_order_relaxed);

    const auto parts = split_endpoint(config_.endpoint);
    if (!parts) {
        transport_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<double>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Malformed scoring endpoint: {}", Sanitizer::sanitize(config_.endpoint)));
    }

    httplib::Client cli(parts->scheme_host_port);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.read_timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.read_timeout_ms));

    const httplib::Headers headers = {
        {http::kAcceptHeader, http::kJsonContentType}
    };

    utils::log::debug(std::format("Sending payload to scoring service: {}",
                                  Sanitizer::mask_for_log(payload_json)));

    const utils::Timer timer;
    const auto res = cli.Post(parts->path, headers, payload_json, http::kJsonUtf8ContentType);

    if (!res) {
        transport_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<double>::error(ErrorCategory::TRANSPORT_ERROR,
            std::format("HTTP request failed: {} ({} ms)",
                        httplib::to_string(res.error()), timer.elapsed_ms().count()));
    }

    utils::log::debug(std::format("Scoring service HTTP {} body: {}",
                                  res->status, Sanitizer::mask_for_log(res->body)));

    if (res->status < 200 || res->status >= 300) {
        http_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<double>::error(ErrorCategory::TRANSPORT_ERROR,
            std::format("Scoring service returned non-2xx status: {} - {}",
                        res->status, Sanitizer::mask_for_log(res->body)));
    }

    auto result = parse_score(res->body);
    if (result.is_error()) {
        protocol_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

// ============================================================================
// Stats
// ============================================================================

HttpScoringClient::Stats HttpScoringClient::get_stats() const {
    return {
        calls_.load(std::memory_order_relaxed),
        transport_errors_.load(std::memory_order_relaxed),
        http_errors_.load(std::memory_order_relaxed),
        protocol_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace rbagate

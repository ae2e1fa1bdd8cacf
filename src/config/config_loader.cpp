#include "config/config_loader.hpp"
#include "scoring/http_scoring_client.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace rbagate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    cfg.threads = s["threads"].value_or(cfg.threads);
    cfg.max_request_bytes = s["max_request_bytes"].value_or(cfg.max_request_bytes);
    return cfg;
}

ScoringConfig extract_scoring(const toml::table& root) {
    ScoringConfig cfg;
    const auto* scoring = root["scoring"].as_table();
    if (!scoring) return cfg;
    const auto& s = *scoring;

    cfg.endpoint = s["endpoint"].value_or(""s);
    if (const auto threshold = s["failure_threshold"].value<double>()) {
        cfg.failure_threshold = *threshold;
        cfg.failure_threshold_set = true;
    }
    cfg.connect_timeout_ms = s["connect_timeout_ms"].value_or(cfg.connect_timeout_ms);
    cfg.read_timeout_ms = s["read_timeout_ms"].value_or(cfg.read_timeout_ms);
    cfg.max_payload_bytes = s["max_payload_bytes"].value_or(cfg.max_payload_bytes);
    return cfg;
}

DenialCacheConfig extract_denial_cache(const toml::table& root) {
    DenialCacheConfig cfg;
    const auto* cache = root["denial_cache"].as_table();
    if (!cache) return cfg;

    cfg.ttl_seconds = (*cache)["ttl_seconds"].value_or(cfg.ttl_seconds);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

GateConfig extract_all_sections(const toml::table& tbl) {
    GateConfig config;
    config.server = extract_server(tbl);
    config.scoring = extract_scoring(tbl);
    config.denial_cache = extract_denial_cache(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GateConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GateConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (!utils::in_range<1, config_limits::kMaxThreads>(config.server.threads)) {
        errors.push_back(std::format("server.threads must be 1-{}, got {}",
            config_limits::kMaxThreads, config.server.threads));
    }
    if (!utils::in_range<1, config_limits::kMaxRequestBytes>(config.server.max_request_bytes)) {
        errors.push_back(std::format("server.max_request_bytes must be 1-{}, got {}",
            config_limits::kMaxRequestBytes, config.server.max_request_bytes));
    }

    if (utils::is_blank(config.scoring.endpoint)) {
        errors.push_back("scoring.endpoint is required");
    } else if (!HttpScoringClient::split_endpoint(config.scoring.endpoint)) {
        errors.push_back(std::format(
            "scoring.endpoint must be an http:// or https:// URL, got '{}'",
            config.scoring.endpoint));
    }

    if (!config.scoring.failure_threshold_set) {
        errors.push_back("scoring.failure_threshold is required");
    } else if (!std::isfinite(config.scoring.failure_threshold)) {
        errors.push_back("scoring.failure_threshold must be a finite number");
    }

    if (!utils::in_range<1, config_limits::kMaxTimeoutMs>(config.scoring.connect_timeout_ms)) {
        errors.push_back(std::format("scoring.connect_timeout_ms must be 1-{}, got {}",
            config_limits::kMaxTimeoutMs, config.scoring.connect_timeout_ms));
    }
    if (!utils::in_range<1, config_limits::kMaxTimeoutMs>(config.scoring.read_timeout_ms)) {
        errors.push_back(std::format("scoring.read_timeout_ms must be 1-{}, got {}",
            config_limits::kMaxTimeoutMs, config.scoring.read_timeout_ms));
    }
    if (!utils::in_range<1, config_limits::kMaxRequestBytes>(config.scoring.max_payload_bytes)) {
        errors.push_back(std::format("scoring.max_payload_bytes must be 1-{}, got {}",
            config_limits::kMaxRequestBytes, config.scoring.max_payload_bytes));
    }

    if (!utils::in_range<1, config_limits::kMaxTtlSeconds>(config.denial_cache.ttl_seconds)) {
        errors.push_back(std::format("denial_cache.ttl_seconds must be 1-{}, got {}",
            config_limits::kMaxTtlSeconds, config.denial_cache.ttl_seconds));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace rbagate

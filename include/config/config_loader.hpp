#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rbagate {

// ============================================================================
// Server Config (decision service)
// ============================================================================

// Numeric fields stay int64_t (the TOML integer type) until validate_config()
// has range-checked them; callers narrow afterwards.
struct ServerConfig {
    std::string host = "127.0.0.1";
    int64_t port = 8089;
    int64_t threads = 8;
    int64_t max_request_bytes = 64 * 1024;
};

// ============================================================================
// Scoring Config
// ============================================================================

struct ScoringConfig {
    std::string endpoint;
    double failure_threshold = 0.0;
    bool failure_threshold_set = false;
    int64_t connect_timeout_ms = 5000;
    int64_t read_timeout_ms = 5000;
    int64_t max_payload_bytes = 64 * 1024;
};

namespace config_limits {

inline constexpr int64_t kMaxThreads = 1024;
inline constexpr int64_t kMaxRequestBytes = 16 * 1024 * 1024;
inline constexpr int64_t kMaxTimeoutMs = 10 * 60 * 1000;
inline constexpr int64_t kMaxTtlSeconds = 30 * 24 * 3600;

} // namespace config_limits

// ============================================================================
// Denial Cache Config
// ============================================================================

struct DenialCacheConfig {
    int64_t ttl_seconds = 3600;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// GateConfig - Complete parsed configuration
// ============================================================================

struct GateConfig {
    ServerConfig server;
    ScoringConfig scoring;
    DenialCacheConfig denial_cache;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GateConfig config;

        static LoadResult ok(GateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to rba_gate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a parsed config for values the gate cannot run with
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GateConfig& config);

private:
    static LoadResult validate_and_return(GateConfig config);
};

} // namespace rbagate

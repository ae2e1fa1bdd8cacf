#pragma once

#include "scoring/iscoring_client.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace rbagate {

/**
 * @brief Scoring client that POSTs the payload over HTTP(S) via httplib::Client.
 *
 * Features:
 * - Separate connect and read timeouts
 * - No retries: one failed exchange fails the login attempt
 * - Response bodies reach the logs only as a bounded preview
 */
class HttpScoringClient : public IScoringClient {
public:
    struct Config {
        std::string endpoint;
        uint32_t connect_timeout_ms = 5000;
        uint32_t read_timeout_ms = 5000;
    };

    /// Endpoint URL split for httplib: "scheme://host[:port]" and "/path[?query]"
    struct EndpointParts {
        std::string scheme_host_port;
        std::string path;
    };

    explicit HttpScoringClient(Config config);

    [[nodiscard]] Result<double> score(const std::string& payload_json) override;

    [[nodiscard]] std::string name() const override { return "http"; }

    [[nodiscard]] const Config& config() const { return config_; }

    /// Split an http:// or https:// URL; nullopt when malformed
    [[nodiscard]] static std::optional<EndpointParts> split_endpoint(const std::string& url);

    /**
     * @brief Extract threatScore from a 2xx response body
     * @return Finite score, or PROTOCOL_ERROR
     */
    [[nodiscard]] static Result<double> parse_score(const std::string& body);

    struct Stats {
        uint64_t calls = 0;
        uint64_t transport_errors = 0;
        uint64_t http_errors = 0;
        uint64_t protocol_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> transport_errors_{0};
    std::atomic<uint64_t> http_errors_{0};
    std::atomic<uint64_t> protocol_errors_{0};
};

} // namespace rbagate

#pragma once

#include "core/error.hpp"

#include <string>

namespace rbagate {

/**
 * @brief Interface to the external scoring oracle.
 *
 * A single synchronous exchange: serialized JSON payload in, threat score out.
 * Implementations must bound the call with timeouts and must report every
 * failure (transport, HTTP status, malformed body, missing or non-finite
 * score) as an error Result rather than throwing.
 */
class IScoringClient {
public:
    virtual ~IScoringClient() = default;

    /**
     * @brief Submit a login payload for scoring
     * @param payload_json UTF-8 JSON object {username, ipAddress, userAgent, metrics}
     * @return threatScore on success (always finite)
     */
    [[nodiscard]] virtual Result<double> score(const std::string& payload_json) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace rbagate

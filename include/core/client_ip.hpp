#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rbagate {

/**
 * @brief Resolve the client address for a login.
 *
 * Takes the first comma-separated, trimmed, non-empty token of the forwarding
 * header when the header is present and not blank; otherwise the transport
 * peer address. The result is sanitized.
 */
[[nodiscard]] std::string extract_client_ip(std::string_view remote_addr,
                                            const std::optional<std::string>& forwarded_for);

} // namespace rbagate

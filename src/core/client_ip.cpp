#include "core/client_ip.hpp"
#include "core/utils.hpp"
#include "security/sanitizer.hpp"

namespace rbagate {

std::string extract_client_ip(std::string_view remote_addr,
                              const std::optional<std::string>& forwarded_for) {
    if (forwarded_for && !utils::is_blank(*forwarded_for)) {
        // Only the leftmost hop counts; an empty leftmost token falls back
        const std::string_view xff = *forwarded_for;
        const auto first = utils::trim(xff.substr(0, xff.find(',')));
        if (!first.empty()) {
            return Sanitizer::sanitize(first);
        }
    }
    return Sanitizer::sanitize(remote_addr);
}

} // namespace rbagate

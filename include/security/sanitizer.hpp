#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rbagate {

/**
 * @brief Normalizes a single untrusted string before it reaches a payload or log line.
 *
 * sanitize():
 * - null input becomes ""
 * - Unicode control characters (C0, DEL, C1) are removed, as are byte
 *   sequences that are not valid UTF-8
 * - leading/trailing whitespace is trimmed after stripping
 * - the result is cut to kMaxChars code points
 *
 * Output is always valid UTF-8, so it can be serialized by nlohmann::json
 * without throwing.
 */
class Sanitizer {
public:
    static constexpr size_t kMaxChars = 256;

    // Payloads up to this many bytes are logged whole
    static constexpr size_t kLogPassthroughBytes = 512;
    // Longer payloads keep only this prefix
    static constexpr size_t kLogPrefixBytes = 256;

    [[nodiscard]] static std::string sanitize(std::optional<std::string_view> input);

    /// True when every code point is Unicode whitespace (empty counts as blank).
    /// Malformed UTF-8 is never blank.
    [[nodiscard]] static bool is_blank(std::string_view utf8);

    /// Cut valid UTF-8 to at most max_chars code points
    [[nodiscard]] static std::string truncate_chars(std::string_view utf8, size_t max_chars);

    /// Number of code points in valid UTF-8 (invalid bytes count as one each)
    [[nodiscard]] static size_t char_count(std::string_view utf8);

    /// Short preview of a payload: "<prefix>...[truncated:N bytes]" when large
    [[nodiscard]] static std::string mask_for_log(std::string_view payload);
};

} // namespace rbagate

#include "security/sanitizer.hpp"

#include <format>

namespace rbagate {

namespace {

inline bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

/**
 * @brief Decode one UTF-8 sequence starting at pos.
 * @return Sequence length, or 0 if the bytes at pos are not well-formed
 *         (overlong forms, surrogates and values above U+10FFFF are rejected).
 */
size_t decode_one(std::string_view s, size_t pos, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    const size_t remaining = s.size() - pos;

    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[pos + k]); };

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        if (remaining < 2 || !is_continuation(byte(1))) return 0;
        cp = (static_cast<char32_t>(b0 & 0x1F) << 6) | (byte(1) & 0x3F);
        return 2;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (remaining < 3) return 0;
        const auto b1 = byte(1);
        const unsigned char lo = (b0 == 0xE0) ? 0xA0 : 0x80;
        const unsigned char hi = (b0 == 0xED) ? 0x9F : 0xBF;
        if (b1 < lo || b1 > hi || !is_continuation(byte(2))) return 0;
        cp = (static_cast<char32_t>(b0 & 0x0F) << 12) |
             (static_cast<char32_t>(b1 & 0x3F) << 6) |
             (byte(2) & 0x3F);
        return 3;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (remaining < 4) return 0;
        const auto b1 = byte(1);
        const unsigned char lo = (b0 == 0xF0) ? 0x90 : 0x80;
        const unsigned char hi = (b0 == 0xF4) ? 0x8F : 0xBF;
        if (b1 < lo || b1 > hi || !is_continuation(byte(2)) || !is_continuation(byte(3))) {
            return 0;
        }
        cp = (static_cast<char32_t>(b0 & 0x07) << 18) |
             (static_cast<char32_t>(b1 & 0x3F) << 12) |
             (static_cast<char32_t>(byte(2) & 0x3F) << 6) |
             (byte(3) & 0x3F);
        return 4;
    }

    return 0;
}

void encode(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// General category Cc
inline bool is_control(char32_t cp) {
    return cp <= 0x1F || (cp >= 0x7F && cp <= 0x9F);
}

// Unicode White_Space minus the Cc members, which are already stripped
inline bool is_space(char32_t cp) {
    switch (cp) {
        case 0x0020: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

// Cc members of White_Space
inline bool is_control_space(char32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) || cp == 0x85;
}

} // anonymous namespace

std::string Sanitizer::sanitize(std::optional<std::string_view> input) {
    if (!input) return "";
    const std::string_view s = *input;

    std::u32string kept;
    kept.reserve(s.size());

    for (size_t pos = 0; pos < s.size(); ) {
        char32_t cp = 0;
        const size_t len = decode_one(s, pos, cp);
        if (len == 0) {
            ++pos;  // drop the malformed byte
            continue;
        }
        pos += len;
        if (!is_control(cp)) {
            kept.push_back(cp);
        }
    }

    size_t begin = 0;
    size_t end = kept.size();
    while (begin < end && is_space(kept[begin])) ++begin;
    while (end > begin && is_space(kept[end - 1])) --end;
    if (end - begin > kMaxChars) {
        end = begin + kMaxChars;
    }

    std::string out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        encode(kept[i], out);
    }
    return out;
}

bool Sanitizer::is_blank(std::string_view utf8) {
    for (size_t pos = 0; pos < utf8.size(); ) {
        char32_t cp = 0;
        const size_t len = decode_one(utf8, pos, cp);
        if (len == 0 || !(is_space(cp) || is_control_space(cp))) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::string Sanitizer::truncate_chars(std::string_view utf8, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < utf8.size() && chars < max_chars) {
        char32_t cp = 0;
        const size_t len = decode_one(utf8, pos, cp);
        pos += (len == 0) ? 1 : len;
        ++chars;
    }
    return std::string(utf8.substr(0, pos));
}

size_t Sanitizer::char_count(std::string_view utf8) {
    size_t chars = 0;
    for (size_t pos = 0; pos < utf8.size(); ++chars) {
        char32_t cp = 0;
        const size_t len = decode_one(utf8, pos, cp);
        pos += (len == 0) ? 1 : len;
    }
    return chars;
}

std::string Sanitizer::mask_for_log(std::string_view payload) {
    // Control bytes are blanked so a preview can never split a log line
    auto printable = [](std::string_view sv) {
        std::string out(sv);
        for (char& c : out) {
            const auto b = static_cast<unsigned char>(c);
            if (b < 0x20 || b == 0x7F) c = ' ';
        }
        return out;
    };

    if (payload.size() <= kLogPassthroughBytes) {
        return printable(payload);
    }

    size_t cut = kLogPrefixBytes;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(payload[cut]))) {
        --cut;
    }
    return std::format("{}...[truncated:{} bytes]",
                       printable(payload.substr(0, cut)), payload.size());
}

} // namespace rbagate

#include "security/metrics_validator.hpp"
#include "security/sanitizer.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <format>
#include <variant>

namespace rbagate {

namespace {

inline bool is_number_char(char c) {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

/**
 * @brief Replace number literals that overflow a double with null.
 *
 * nlohmann_json fails the whole document on such a literal; after the
 * rewrite only the affected value is lost. String contents are left alone.
 */
std::string null_overflowing_numbers(std::string_view raw, size_t& replaced) {
    std::string out;
    out.reserve(raw.size());

    bool in_string = false;
    bool escaped = false;
    size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (in_string) {
            out += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            ++i;
            continue;
        }

        if (c == '"') {
            in_string = true;
            out += c;
            ++i;
            continue;
        }

        if (c == '-' || (c >= '0' && c <= '9')) {
            size_t end = i;
            while (end < raw.size() && is_number_char(raw[end])) ++end;
            const std::string token(raw.substr(i, end - i));
            if (std::isfinite(std::strtod(token.c_str(), nullptr))) {
                out += token;
            } else {
                out += "null";
                ++replaced;
            }
            i = end;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

} // anonymous namespace

std::optional<nlohmann::ordered_json> SchemaValidator::sanitize_field(
    const AllowedField& field, const nlohmann::json& value) {

    switch (field.type) {
        case FieldType::NUMBER: {
            if (!value.is_number()) {
                utils::log::warn(std::format(
                    "Telemetry field '{}' expected NUMBER but was {}; skipping",
                    field.name, value.type_name()));
                return std::nullopt;
            }
            const double dv = value.get<double>();
            if (!std::isfinite(dv)) {
                utils::log::warn(std::format(
                    "Telemetry field '{}' is not finite; skipping", field.name));
                return std::nullopt;
            }
            return std::visit(
                [](auto clamped) { return nlohmann::ordered_json(clamped); },
                metrics_schema::clamp(dv, field.bound));
        }

        case FieldType::BOOLEAN:
            if (!value.is_boolean()) {
                utils::log::warn(std::format(
                    "Telemetry field '{}' expected BOOLEAN but was {}; skipping",
                    field.name, value.type_name()));
                return std::nullopt;
            }
            return nlohmann::ordered_json(value.get<bool>());

        case FieldType::STRING: {
            if (!value.is_string()) {
                utils::log::warn(std::format(
                    "Telemetry field '{}' expected STRING but was {}; skipping",
                    field.name, value.type_name()));
                return std::nullopt;
            }
            auto s = Sanitizer::sanitize(value.get_ref<const std::string&>());
            if (field.max_chars > 0) {
                s = Sanitizer::truncate_chars(s, field.max_chars);
            }
            return nlohmann::ordered_json(std::move(s));
        }
    }
    return std::nullopt;
}

std::optional<SanitizedMetrics> SchemaValidator::validate(
    std::optional<std::string_view> raw) const {

    const auto reject = [this]() -> std::optional<SanitizedMetrics> {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    };

    if (!raw) {
        return reject();
    }

    if (raw->size() > metrics_schema::kMaxMetricsBytes) {
        utils::log::warn(std::format(
            "Telemetry exceeded max allowed size ({} bytes) and was rejected", raw->size()));
        return reject();
    }

    size_t overflowing = 0;
    const auto text = null_overflowing_numbers(*raw, overflowing);
    if (overflowing > 0) {
        utils::log::warn(std::format(
            "Telemetry carried {} number literal(s) outside double range; values dropped",
            overflowing));
    }

    const auto parsed = nlohmann::json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        utils::log::warn(std::format("Telemetry JSON parse failed: {}",
                                     Sanitizer::mask_for_log(*raw)));
        return reject();
    }

    if (!parsed.is_object()) {
        utils::log::warn(std::format("Telemetry is a JSON {}, not an object; rejecting",
                                     parsed.type_name()));
        return reject();
    }

    auto out = nlohmann::ordered_json::object();
    for (const auto& field : metrics_schema::allowed_fields()) {
        const std::string key(field.name);
        const auto it = parsed.find(key);
        if (it == parsed.end() || it->is_null()) {
            continue;
        }

        auto value = sanitize_field(field, *it);
        if (!value) {
            fields_dropped_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        out[key] = std::move(*value);
    }

    const auto out_bytes = out.dump().size();
    if (out_bytes > metrics_schema::kMaxMetricsBytes) {
        utils::log::warn(std::format(
            "Sanitized telemetry exceeds allowed size ({} bytes); rejecting", out_bytes));
        return reject();
    }

    validated_.fetch_add(1, std::memory_order_relaxed);
    return SanitizedMetrics(std::move(out));
}

SchemaValidator::Stats SchemaValidator::get_stats() const {
    return {
        validated_.load(std::memory_order_relaxed),
        rejected_.load(std::memory_order_relaxed),
        fields_dropped_.load(std::memory_order_relaxed)
    };
}

} // namespace rbagate

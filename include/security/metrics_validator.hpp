#pragma once

#include "security/metrics_schema.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rbagate {

/**
 * @brief Telemetry reduced to allow-listed, type-checked, bounded fields.
 *
 * Keys appear in allow-list order. Values are int64, double, bool or string.
 */
class SanitizedMetrics {
public:
    SanitizedMetrics() : data_(nlohmann::ordered_json::object()) {}
    explicit SanitizedMetrics(nlohmann::ordered_json data) : data_(std::move(data)) {}

    [[nodiscard]] bool contains(std::string_view key) const {
        return data_.contains(std::string(key));
    }

    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool empty() const { return data_.empty(); }

    [[nodiscard]] const nlohmann::ordered_json& json() const { return data_; }

    [[nodiscard]] std::string dump() const { return data_.dump(); }

    template<typename T>
    [[nodiscard]] T get(std::string_view key) const {
        return data_.at(std::string(key)).template get<T>();
    }

private:
    nlohmann::ordered_json data_;
};

/**
 * @brief Validates raw telemetry against the fixed allow-list.
 *
 * A payload that is null, larger than 8 KiB, not JSON, or not a JSON object
 * is rejected as a whole (std::nullopt). Inside an accepted object, a field
 * with the wrong type or a non-finite number is dropped on its own and the
 * rest of the payload survives. A number literal beyond double range is
 * non-finite and only its own value is lost. Keys outside the allow-list never
 * reach the output. The rebuilt result is rejected if it serializes to more than 8 KiB.
 */
class SchemaValidator {
public:
    struct Stats {
        uint64_t validated = 0;
        uint64_t rejected = 0;
        uint64_t fields_dropped = 0;
    };

    [[nodiscard]] std::optional<SanitizedMetrics> validate(
        std::optional<std::string_view> raw) const;

    /**
     * @brief Reduce one JSON value according to its allow-list entry.
     * @return The bounded value, or nullopt when the field must be dropped
     */
    [[nodiscard]] static std::optional<nlohmann::ordered_json> sanitize_field(
        const AllowedField& field, const nlohmann::json& value);

    [[nodiscard]] Stats get_stats() const;

private:
    mutable std::atomic<uint64_t> validated_{0};
    mutable std::atomic<uint64_t> rejected_{0};
    mutable std::atomic<uint64_t> fields_dropped_{0};
};

} // namespace rbagate

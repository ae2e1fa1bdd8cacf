#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

namespace rbagate {

enum class FieldType : uint8_t {
    NUMBER,
    BOOLEAN,
    STRING
};

[[nodiscard]] inline const char* field_type_to_string(FieldType type) {
    switch (type) {
        case FieldType::NUMBER:  return "NUMBER";
        case FieldType::BOOLEAN: return "BOOLEAN";
        case FieldType::STRING:  return "STRING";
        default:                 return "UNKNOWN";
    }
}

/// How a numeric value is reduced into its bound
enum class BoundKind : uint8_t {
    INTEGER,    // round half away from zero, clamp, emit int64
    FLOATING    // clamp, emit double
};

struct NumericBound {
    BoundKind kind = BoundKind::FLOATING;
    double lo = 0.0;
    double hi = 0.0;
};

// Bound for numeric fields without a field-specific range
inline constexpr NumericBound kGenericBound{BoundKind::FLOATING, -1'000'000'000.0, 1'000'000'000.0};

/**
 * @brief One entry of the telemetry allow-list.
 *
 * bound applies to NUMBER fields, max_chars (0 = none beyond the sanitizer's
 * own limit) to STRING fields.
 */
struct AllowedField {
    std::string_view name;
    FieldType type = FieldType::NUMBER;
    NumericBound bound = kGenericBound;
    size_t max_chars = 0;
};

using ClampedNumber = std::variant<int64_t, double>;

namespace metrics_schema {

inline constexpr size_t kMaxMetricsBytes = 8 * 1024;
inline constexpr int64_t kMaxCounter = 1'000'000'000;
inline constexpr int64_t kMaxKeyCount = 10'000;
inline constexpr int64_t kMaxClickCount = 10'000;
inline constexpr int64_t kMaxDistancePx = 10'000'000;
inline constexpr int64_t kMaxDurationMs = 86'400'000;    // 24h
inline constexpr int64_t kMaxMetricsVersion = 1000;
inline constexpr int64_t kMaxTzOffsetMin = 24 * 60;
inline constexpr int64_t kMaxDeviceMemoryGb = 1024;
inline constexpr int64_t kMaxHardwareConcurrency = 1024;
inline constexpr double kMaxPixelRatio = 16.0;
inline constexpr size_t kMaxCollectionTimestampChars = 64;

/// The allow-list, in output order
[[nodiscard]] std::span<const AllowedField> allowed_fields();

/// Allow-list entry by name, or nullptr
[[nodiscard]] const AllowedField* find_field(std::string_view name);

/// Round-then-clamp for INTEGER bounds. NaN yields the lower bound.
[[nodiscard]] int64_t clamp_integer(double value, const NumericBound& bound);

/// Clamp for FLOATING bounds. NaN yields the lower bound.
[[nodiscard]] double clamp_floating(double value, const NumericBound& bound);

/// Dispatch on bound.kind
[[nodiscard]] ClampedNumber clamp(double value, const NumericBound& bound);

} // namespace metrics_schema

} // namespace rbagate

#include "security/metrics_schema.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace rbagate::metrics_schema {

namespace {

constexpr NumericBound integer_bound(int64_t lo, int64_t hi) {
    return {BoundKind::INTEGER, static_cast<double>(lo), static_cast<double>(hi)};
}

constexpr AllowedField number_field(std::string_view name, NumericBound bound) {
    return {name, FieldType::NUMBER, bound, 0};
}

constexpr AllowedField bool_field(std::string_view name) {
    return {name, FieldType::BOOLEAN, kGenericBound, 0};
}

constexpr AllowedField string_field(std::string_view name, size_t max_chars = 0) {
    return {name, FieldType::STRING, kGenericBound, max_chars};
}

constexpr NumericBound kCounter = integer_bound(0, kMaxCounter);
constexpr NumericBound kDuration = integer_bound(0, kMaxDurationMs);
constexpr NumericBound kDistance = integer_bound(0, kMaxDistancePx);

constexpr std::array kAllowedFields = {
    number_field("focus_changes",          kCounter),
    number_field("blur_events",            kCounter),
    number_field("click_count",            integer_bound(0, kMaxClickCount)),
    number_field("key_count",              integer_bound(0, kMaxKeyCount)),
    number_field("avg_key_delay_ms",       kDuration),
    number_field("pointer_distance_px",    kDistance),
    number_field("pointer_event_count",    kCounter),
    number_field("scroll_distance_px",     kDistance),
    number_field("scroll_event_count",     kCounter),
    number_field("dom_ready_ms",           kDuration),
    number_field("time_to_first_key_ms",   kDuration),
    number_field("time_to_first_click_ms", kDuration),
    number_field("idle_time_total_ms",     kDuration),
    number_field("input_focus_count",      kCounter),
    number_field("paste_events",           kCounter),
    number_field("resize_events",          kCounter),
    number_field("metrics_version",        integer_bound(0, kMaxMetricsVersion)),
    string_field("collection_timestamp",   kMaxCollectionTimestampChars),
    number_field("tz_offset_min",          integer_bound(-kMaxTzOffsetMin, kMaxTzOffsetMin)),
    string_field("language"),
    string_field("platform"),
    number_field("device_memory_gb",       integer_bound(0, kMaxDeviceMemoryGb)),
    number_field("hardware_concurrency",   integer_bound(1, kMaxHardwareConcurrency)),
    number_field("screen_width_px",        kCounter),
    number_field("screen_height_px",       kCounter),
    number_field("pixel_ratio",            NumericBound{BoundKind::FLOATING, 0.0, kMaxPixelRatio}),
    number_field("color_depth",            kCounter),
    bool_field("touch_support"),
    bool_field("webauthn_supported"),
    string_field("device_uuid"),
};

} // anonymous namespace

std::span<const AllowedField> allowed_fields() {
    return kAllowedFields;
}

const AllowedField* find_field(std::string_view name) {
    const auto it = std::find_if(kAllowedFields.begin(), kAllowedFields.end(),
        [name](const AllowedField& f) { return f.name == name; });
    return it != kAllowedFields.end() ? &*it : nullptr;
}

int64_t clamp_integer(double value, const NumericBound& bound) {
    if (std::isnan(value)) {
        return static_cast<int64_t>(bound.lo);
    }
    // Bounds are integral, so clamping before rounding gives the same result
    // as rounding first, without overflowing llround on huge inputs.
    return std::llround(std::clamp(value, bound.lo, bound.hi));
}

double clamp_floating(double value, const NumericBound& bound) {
    if (std::isnan(value)) {
        return bound.lo;
    }
    return std::clamp(value, bound.lo, bound.hi);
}

ClampedNumber clamp(double value, const NumericBound& bound) {
    if (bound.kind == BoundKind::INTEGER) {
        return clamp_integer(value, bound);
    }
    return clamp_floating(value, bound);
}

} // namespace rbagate::metrics_schema

#pragma once

#include <optional>
#include <string>

namespace rbagate {

/**
 * @brief Error categories for the gate
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    VALIDATION_ERROR,
    TRANSPORT_ERROR,
    PROTOCOL_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::CONFIG_ERROR:     return "config_error";
        case ErrorCategory::VALIDATION_ERROR: return "validation_error";
        case ErrorCategory::TRANSPORT_ERROR:  return "transport_error";
        case ErrorCategory::PROTOCOL_ERROR:   return "protocol_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
        default:                              return "unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace rbagate

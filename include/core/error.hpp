#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace llmshield {

/**
 * @brief Error categories for genuine faults
 *
 * A BLOCK decision or an exceeded budget is a normal result, never an error.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    STORE_ERROR,
    MANIFEST_ERROR,
    SCANNER_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::STORE_ERROR:    return "store_error";
        case ErrorCategory::MANIFEST_ERROR: return "manifest_error";
        case ErrorCategory::SCANNER_ERROR:  return "scanner_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

/**
 * @brief Exception thrown for construction-time and call-site faults
 */
class ShieldError : public std::runtime_error {
public:
    ShieldError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

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

} // namespace llmshield

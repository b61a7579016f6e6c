#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace textanon {

/**
 * @brief Error categories for the anonymizer
 */
enum class ErrorCategory {
    NONE,
    INVALID_ARGUMENT,
    INVALID_PATTERN_SYNTAX,
    PATTERN_NOT_FOUND,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "NONE";
        case ErrorCategory::INVALID_ARGUMENT:       return "INVALID_ARGUMENT";
        case ErrorCategory::INVALID_PATTERN_SYNTAX: return "INVALID_PATTERN_SYNTAX";
        case ErrorCategory::PATTERN_NOT_FOUND:      return "PATTERN_NOT_FOUND";
        case ErrorCategory::CONFIG_ERROR:           return "CONFIG_ERROR";
        case ErrorCategory::INTERNAL_ERROR:         return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
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

/**
 * @brief Fatal failure of an anonymize() call
 *
 * Raised only when assembling the result fails outside of per-match
 * isolation. what() carries the full message, cause() the underlying error.
 */
class PipelineFailure : public std::runtime_error {
public:
    explicit PipelineFailure(const std::string& cause)
        : std::runtime_error("Data anonymization failed: " + cause),
          cause_(cause) {}

    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

} // namespace textanon

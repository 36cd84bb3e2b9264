#pragma once

/**
 * Standardized error handling utilities
 *
 * Every failure the client can report belongs to one of three kinds.
 * Components return a Result<T> instead of throwing; the entry point maps
 * the error kind to the process exit code.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "constants.hpp"

namespace error_handling {

enum class ErrorKind {
    CONFIGURATION,   // credentials or config file unusable
    VALIDATION,      // order parameters rejected locally
    SUBMISSION       // exchange or transport rejected the order
};

struct Error {
    ErrorKind kind{ErrorKind::VALIDATION};
    std::string message;
    int code{0};          // exchange error code, 0 when none was returned
    int http_status{0};   // 0 when no HTTP response was received
};

// Process exit code reported for each error kind
inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION: return constants::exit_code::CONFIGURATION_ERROR;
        case ErrorKind::VALIDATION: return constants::exit_code::VALIDATION_ERROR;
        case ErrorKind::SUBMISSION: return constants::exit_code::SUBMISSION_ERROR;
    }
    return constants::exit_code::SUBMISSION_ERROR;
}

inline Error configuration_error(const std::string& message) {
    return Error{ErrorKind::CONFIGURATION, message, 0, 0};
}

inline Error validation_error(const std::string& message) {
    return Error{ErrorKind::VALIDATION, message, 0, 0};
}

inline Error submission_error(const std::string& message, int code = 0, int http_status = 0) {
    return Error{ErrorKind::SUBMISSION, message, code, http_status};
}

/**
 * Result type for operations that can fail
 * Similar to Rust's Result<T, E> or std::expected
 */
template<typename T>
class Result {
public:
    // Success constructor
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    // Error constructor
    static Result error(Error error) {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    bool is_success() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    // Get the value (only call if is_success() == true)
    const T& value() const {
        if (!value_) {
            throw std::logic_error("Attempted to get value from error Result");
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Attempted to get value from error Result");
        }
        return *value_;
    }

    // Get the error (only call if is_error() == true)
    const Error& error() const {
        if (value_) {
            throw std::logic_error("Attempted to get error from success Result");
        }
        return error_;
    }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace error_handling

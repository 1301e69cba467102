// include/hedge_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace hedge_ngin {

/**
 * @brief Error codes for the simulation engine
 * Defines all error conditions that can be reported through Result
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Request errors
    VALIDATION_ERROR = 4,
    NOT_FOUND = 5,
    INVALID_STATE_TRANSITION = 6,

    // Data errors
    DATA_NOT_FOUND = 7,
    INVALID_DATA = 8,
    CONVERSION_ERROR = 9,
    MARKET_DATA_ERROR = 10,

    // Trading errors
    INVALID_ORDER = 11,
    INSUFFICIENT_FUNDS = 12,
    COMPUTE_ERROR = 13,

    // Producer errors
    PRODUCER_ERROR = 14,
    INVALID_SIGNAL = 15,
    UPSTREAM_TIMEOUT = 16,
    API_ERROR = 17,

    // Session errors
    CANCELLED = 18,

    // File and I/O errors
    FILE_NOT_FOUND = 19,
    FILE_IO_ERROR = 20,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 21,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INVALID_STATE_TRANSITION:
            return "INVALID_STATE_TRANSITION";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::MARKET_DATA_ERROR:
            return "MARKET_DATA_ERROR";
        case ErrorCode::INVALID_ORDER:
            return "INVALID_ORDER";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::COMPUTE_ERROR:
            return "COMPUTE_ERROR";
        case ErrorCode::PRODUCER_ERROR:
            return "PRODUCER_ERROR";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::UPSTREAM_TIMEOUT:
            return "UPSTREAM_TIMEOUT";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carried by a failed Result
 */
class HedgeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for HedgeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    HedgeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<HedgeError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws HedgeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const HedgeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<HedgeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<HedgeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const HedgeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<HedgeError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<HedgeError>(code, message, component));
}

/**
 * @brief Re-wrap an existing error into a Result of another type
 */
template <typename T>
Result<T> forward_error(const HedgeError* error) {
    return make_error<T>(error->code(), error->what(), error->component());
}

}  // namespace hedge_ngin

// include/divcap/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace divcap {

/**
 * @brief Error codes for the backtesting system
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    DATA_VALIDATION_FAILED = 6,
    CONVERSION_ERROR = 7,

    // Trading outcomes
    INSUFFICIENT_CASH = 8,
    DUPLICATE_ENTRY = 9,
    NO_POSITION = 10,
    INVALID_TRADE = 11,

    // Strategy errors
    SIGNAL_REJECTED = 12,

    // File and I/O errors
    FILE_NOT_FOUND = 13,
    FILE_IO_ERROR = 14,

    // Configuration and parsing errors
    JSON_PARSE_ERROR = 15,
    INVALID_CONFIG = 16
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
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::DATA_VALIDATION_FAILED:
            return "DATA_VALIDATION_FAILED";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INSUFFICIENT_CASH:
            return "INSUFFICIENT_CASH";
        case ErrorCode::DUPLICATE_ENTRY:
            return "DUPLICATE_ENTRY";
        case ErrorCode::NO_POSITION:
            return "NO_POSITION";
        case ErrorCode::INVALID_TRADE:
            return "INVALID_TRADE";
        case ErrorCode::SIGNAL_REJECTED:
            return "SIGNAL_REJECTED";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Exception type carrying an error code and the failing component
 */
class BacktestError : public std::runtime_error {
public:
    /**
     * @brief Constructor for BacktestError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    BacktestError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<BacktestError> error) : error_(std::move(error)) {}

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
     * @throws BacktestError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws BacktestError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const BacktestError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<BacktestError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<BacktestError> error) : error_(std::move(error)) {}

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

    const BacktestError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<BacktestError> error_;
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
    return Result<T>(std::make_unique<BacktestError>(code, message, component));
}

}  // namespace divcap

// include/trend_engine/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace trend_engine {

/**
 * @brief Error codes for the strategy engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,
    INVALID_STATE = 4,

    // Market data errors (fatal for a backtest run)
    SEQUENCE_ERROR = 10,
    DATA_ERROR = 11,
    CONVERSION_ERROR = 12,

    // Sizing errors (the offending intent is dropped)
    SIZING_ERROR = 20,

    // Soft rejections
    ORDER_REJECTED = 30,
    INSUFFICIENT_FUNDS = 31,
    POSITION_LIMIT_EXCEEDED = 32,
    RISK_LIMIT_EXCEEDED = 33,
    INVALID_ORDER = 34,

    // File and parsing errors
    FILE_NOT_FOUND = 40,
    FILE_IO_ERROR = 41,
    JSON_PARSE_ERROR = 42
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
        case ErrorCode::INVALID_STATE:
            return "INVALID_STATE";
        case ErrorCode::SEQUENCE_ERROR:
            return "SEQUENCE_ERROR";
        case ErrorCode::DATA_ERROR:
            return "DATA_ERROR";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::SIZING_ERROR:
            return "SIZING_ERROR";
        case ErrorCode::ORDER_REJECTED:
            return "ORDER_REJECTED";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::POSITION_LIMIT_EXCEEDED:
            return "POSITION_LIMIT_EXCEEDED";
        case ErrorCode::RISK_LIMIT_EXCEEDED:
            return "RISK_LIMIT_EXCEEDED";
        case ErrorCode::INVALID_ORDER:
            return "INVALID_ORDER";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Whether an error must abort the whole backtest
 *
 * Out-of-order and malformed bars make a replay non-reproducible, so they
 * terminate the run. Everything else is recorded and the step loop continues.
 */
inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::SEQUENCE_ERROR:
        case ErrorCode::DATA_ERROR:
        case ErrorCode::CONVERSION_ERROR:
        case ErrorCode::NOT_INITIALIZED:
        case ErrorCode::INVALID_STATE:
        case ErrorCode::UNKNOWN_ERROR:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Exception type carried by Result on failure
 */
class EngineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for EngineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
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

    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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
     * @throws EngineError if result represents an error
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
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
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
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

/**
 * @brief Re-wrap an error from another Result under a new value type
 */
template <typename T>
Result<T> forward_error(const EngineError& error) {
    return make_error<T>(error.code(), error.what(), error.component());
}

}  // namespace trend_engine

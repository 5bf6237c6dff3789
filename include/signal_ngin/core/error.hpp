// include/signal_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace signal_ngin {

/**
 * @brief Error codes for the signal engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INSUFFICIENT_DATA = 4,
    INVALID_DATA = 5,
    INSTRUMENT_NOT_FOUND = 6,

    // Upstream errors
    UPSTREAM_FETCH_ERROR = 7,
    CONNECTION_ERROR = 8,

    // Scheduling errors
    TIMEOUT_ERROR = 9,
    CANCELLED = 10,

    // Gate errors
    AUTHORIZATION_DENIED = 11,

    // File and parsing errors
    FILE_NOT_FOUND = 12,
    FILE_IO_ERROR = 13,
    JSON_PARSE_ERROR = 14,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Machine-readable kind used in operation responses
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "None";
        case ErrorCode::INVALID_ARGUMENT:
            return "InvalidArgument";
        case ErrorCode::NOT_INITIALIZED:
            return "NotInitialized";
        case ErrorCode::INSUFFICIENT_DATA:
            return "InsufficientData";
        case ErrorCode::INVALID_DATA:
            return "InvalidData";
        case ErrorCode::INSTRUMENT_NOT_FOUND:
            return "InstrumentNotFound";
        case ErrorCode::UPSTREAM_FETCH_ERROR:
            return "UpstreamFetch";
        case ErrorCode::CONNECTION_ERROR:
            return "Connection";
        case ErrorCode::TIMEOUT_ERROR:
            return "Timeout";
        case ErrorCode::CANCELLED:
            return "Cancelled";
        case ErrorCode::AUTHORIZATION_DENIED:
            return "AuthorizationDenied";
        case ErrorCode::FILE_NOT_FOUND:
            return "FileNotFound";
        case ErrorCode::FILE_IO_ERROR:
            return "FileIO";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JsonParse";
        default:
            return "Unknown";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class SignalError : public std::runtime_error {
public:
    /**
     * @brief Constructor for SignalError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    SignalError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Kind string of the error code
     */
    std::string kind() const {
        return error_code_to_string(code_);
    }

    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + kind() + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result, must be default constructible
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<SignalError> error) : error_(std::move(error)) {}

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
     * @throws SignalError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws SignalError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const SignalError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<SignalError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<SignalError> error) : error_(std::move(error)) {}

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

    const SignalError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<SignalError> error_;
};

/**
 * @brief Helper for creating error results
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<SignalError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as the error of another result type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component = "") {
    const SignalError* err = failed.error();
    return make_error<T>(err->code(), err->what(),
                         component.empty() ? err->component() : component);
}

}  // namespace signal_ngin

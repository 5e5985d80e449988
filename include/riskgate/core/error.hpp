// include/riskgate/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace riskgate {

/**
 * @brief Error codes for conditions the risk core reports as failures
 *
 * Expected business outcomes (trade rejections, insufficient history)
 * are never reported through these codes.
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data errors
    INVALID_DATA = 3,
    INSUFFICIENT_DATA = 4,

    // Risk errors
    TRADING_HALTED = 7,

    // Configuration errors
    CONFIG_ERROR = 8,
    FILE_IO_ERROR = 9,
    JSON_PARSE_ERROR = 10,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Exception type carried by failed results
 */
class RiskGateError : public std::runtime_error {
public:
    /**
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    RiskGateError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Format as "Error in <component>: <message> (Code: n)"
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
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

    Result(std::unique_ptr<RiskGateError> error) : error_(std::move(error)) {}

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
     * @throws RiskGateError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present, nullptr on success
     */
    const RiskGateError* error() const {
        return error_.get();
    }

private:
    T value_{};
    std::unique_ptr<RiskGateError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<RiskGateError> error) : error_(std::move(error)) {}

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

    const RiskGateError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<RiskGateError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<RiskGateError>(code, message, component));
}

}  // namespace riskgate

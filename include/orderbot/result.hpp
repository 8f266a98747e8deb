#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace orderbot {

// Error codes for store, provider and pipeline operations
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    ALREADY_EXISTS,
    IO_ERROR,
    CORRUPTION,
    INVALID_ARGUMENT,
    INTERNAL_ERROR,
    // Ordering domain
    EMPTY_CART,         // Checkout or removal against an empty cart
    OUT_OF_STOCK,       // Menu item exists but is unavailable
    // Provider error codes
    RATE_LIMITED,       // HTTP 429 - too many requests
    TIMEOUT,            // Request timeout
    NETWORK_ERROR,      // Connection failures
    MODEL_NOT_FOUND,    // LLM model not available
    AUTH_ERROR,         // Invalid API key or authentication failure
    PROVIDER_UNAVAILABLE,
    PARSE_ERROR         // Provider output was not the expected shape
};

const char* error_code_name(ErrorCode code);

/**
 * Error code plus a human-readable message. A default-constructed Error
 * is the OK state used by Result<void>.
 */
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    // Network-level provider failures that may succeed on a later turn
    bool is_transient() const;

    // Same code, message prefixed with "<context>: "
    Error with_context(const std::string& context) const;

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * Thrown by Result::value() when the result holds an error. Only code
 * that has not checked ok() ever sees it.
 */
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

/**
 * Value or Error. Store, provider and file operations return this
 * instead of throwing; callers check ok() before value().
 */
template<typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : Result(Error(code, std::move(message))) {}

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & {
        require_value();
        return std::get<0>(state_);
    }
    const T& value() const& {
        require_value();
        return std::get<0>(state_);
    }
    T&& value() && {
        require_value();
        return std::get<0>(std::move(state_));
    }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(state_) : std::move(fallback);
    }

    // The OK error when the result holds a value
    const Error& error() const {
        static const Error none;
        return ok() ? none : std::get<1>(state_);
    }

    ErrorCode error_code() const {
        return ok() ? ErrorCode::OK : std::get<1>(state_).code();
    }

private:
    void require_value() const {
        if (!ok()) {
            throw BadResultAccess(std::get<1>(state_));
        }
    }

    std::variant<T, Error> state_;
};

// Success or Error for operations with nothing to return
template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(code, std::move(message)) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw BadResultAccess(error_);
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace orderbot

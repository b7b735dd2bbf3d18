#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace callroute {

/**
 * @brief What went wrong, coarse enough to branch on
 *
 * Compiler and lookup paths are total and never produce these; they come
 * from file loading, predicate parsing, wiring sources and hashing.
 */
enum class ErrorType {
    None,
    IOError,         ///< File missing or unreadable
    NetworkError,    ///< Wiring endpoint unreachable or non-2xx
    ParseError,      ///< Bad JSON or bad edge condition
    InvalidInput,    ///< Well-formed but unacceptable (wrong shape, missing id)
    IntegrityError,  ///< Digest could not be computed
    Timeout,
    Unknown          ///< A callback threw
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "NONE";
        case ErrorType::IOError: return "IO_ERROR";
        case ErrorType::NetworkError: return "NETWORK_ERROR";
        case ErrorType::ParseError: return "PARSE_ERROR";
        case ErrorType::InvalidInput: return "INVALID_INPUT";
        case ErrorType::IntegrityError: return "INTEGRITY_ERROR";
        case ErrorType::Timeout: return "TIMEOUT";
        case ErrorType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, std::string msg) : type(t), message(std::move(msg)) {}

    bool is_error() const { return type != ErrorType::None; }

    /// "TYPE: message"; the form used in bundle errors[] and log lines
    std::string describe() const { return std::string(error_type_name(type)) + ": " + message; }
};

/**
 * @brief Value of type T, or the Error that prevented it
 *
 * Reading the wrong side is a programming mistake and throws
 * std::logic_error carrying the held error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        require_value();
        return std::get<T>(data_);
    }

    T& value() {
        require_value();
        return std::get<T>(data_);
    }

    const Error& error() const {
        if (is_ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& fallback) const {
        return is_ok() ? std::get<T>(data_) : fallback;
    }

private:
    std::variant<T, Error> data_;

    void require_value() const {
        if (!is_ok()) {
            throw std::logic_error("Result holds " + std::get<Error>(data_).describe());
        }
    }
};

/// Success or an Error, nothing else
template<>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.is_error(); }
    bool is_error() const { return error_.is_error(); }
    explicit operator bool() const { return is_ok(); }

    const Error& error() const { return error_; }

private:
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_invalid_input_error(const std::string& message) {
    return Error(ErrorType::InvalidInput, message);
}

inline Error make_integrity_error(const std::string& message) {
    return Error(ErrorType::IntegrityError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace callroute

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <crow.h>

namespace ouroboros {

// Error categories, each mapped to an HTTP status
enum class ErrorCategory {
    Configuration,   // Service configuration problems
    Validation,      // Rejected input (bad request body, invalid import)
    NotFound,        // Named schema/message/operation/channel does not exist
    Conflict,        // Duplicate name or path+method on create
    Parse,           // Document could not be parsed
    Io,              // Persisted document could not be read or written
    Internal         // Anything unexpected
};

/**
 * One field-level problem attached to an error (import validation).
 */
struct ErrorDetail {
    std::string location;
    std::string code;
    std::string message;
};

struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;
    int http_status_code;
    std::vector<ErrorDetail> errors = {};

    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details, 500};
    }

    static Error Validation(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Validation, msg, details, 400};
    }

    static Error NotFound(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::NotFound, msg, details, 404};
    }

    static Error Conflict(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Conflict, msg, details, 409};
    }

    static Error Parse(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Parse, msg, details, 400};
    }

    static Error Io(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Io, msg, details, 500};
    }

    static Error Internal(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Internal, msg, details, 500};
    }

    crow::response toHttpResponse() const;

    crow::json::wvalue toJson() const;

    std::string getCategoryName() const;
};

/**
 * Thrown when a persisted or imported document is not valid YAML.
 */
class SpecParseError : public std::runtime_error {
public:
    explicit SpecParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thrown by the document graph helpers when a precondition on the
 * document does not hold (unknown channel, duplicate message, ...).
 * Services translate it into an Error before it reaches a caller.
 */
class SpecOperationError : public std::runtime_error {
public:
    SpecOperationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const { return category_; }

    Error toError() const;

private:
    ErrorCategory category_;
};

// Expected<T, E> holds either a success value or an error.
// Move-only; value() on an error (or error() on a value) throws.
template<typename T, typename E = Error>
class Expected {
public:
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

template<typename T>
using Result = Expected<T, Error>;

} // namespace ouroboros

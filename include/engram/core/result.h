#ifndef ENGRAM_CORE_RESULT_H_
#define ENGRAM_CORE_RESULT_H_

#include <string>
#include <optional>
#include <memory>
#include <stdexcept>
#include "engram/core/error.h"

namespace engram {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Carries either a value or an error message with its Error::Code, so
 * callers can tell NOT_FOUND from FORBIDDEN without parsing text.
 *
 * Usage:
 * ```
 * Result<NodeId> foo() {
 *     if (owner.empty()) {
 *         return Result<NodeId>::error("empty owner", Error::Code::INVALID_ARGUMENT);
 *     }
 *     return Result<NodeId>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     NodeId id = result.value();
 * } else if (result.code() == Error::Code::NOT_FOUND) {
 *     ...
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }
    bool is(Error::Code code) const { return !ok() && code_ == code; }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        return Result<T>(message, code, ErrorTag{});
    }

    // Re-types the error of another result.
    template<typename U>
    static Result<T> error_from(const Result<U>& other) {
        return Result<T>(other.error(), other.code(), ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    explicit Result(const Error& error)
        : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }
    bool is(Error::Code code) const { return !ok() && code_ == code; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        return Result<void>(message, code, ErrorTag{});
    }

    template<typename U>
    static Result<void> error_from(const Result<U>& other) {
        return Result<void>(other.error(), other.code(), ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_RESULT_H_

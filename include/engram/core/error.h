#ifndef ENGRAM_CORE_ERROR_H_
#define ENGRAM_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace engram {
namespace core {

/**
 * @brief Base class for all Engram errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        FORBIDDEN = 3,
        MAINTENANCE_TIMEOUT = 4,
        STORAGE_UNAVAILABLE = 5,
        CANCELLED = 6,
        INTERNAL = 7
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating the referenced node or grant does not exist
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating a consent or ownership violation
 */
class ForbiddenError : public Error {
public:
    explicit ForbiddenError(const std::string& message)
        : Error(message, Code::FORBIDDEN) {}
};

/**
 * @brief Error indicating the durable store cannot be reached (retryable)
 */
class StorageUnavailableError : public Error {
public:
    explicit StorageUnavailableError(const std::string& message)
        : Error(message, Code::STORAGE_UNAVAILABLE) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

// Stable name for logs and the CLI, e.g. "NOT_FOUND".
const char* error_code_name(Error::Code code);

} // namespace core
} // namespace engram

#endif // ENGRAM_CORE_ERROR_H_

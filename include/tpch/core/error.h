#ifndef TPCH_CORE_ERROR_H_
#define TPCH_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace tpch {
namespace core {

/**
 * @brief Base class for all benchmark errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        TIMEOUT = 3,
        CONNECTION = 4,
        STATEMENT = 5,
        USE_AFTER_CLOSE = 6,
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
 * @brief Name of an error code, e.g. "CONNECTION"
 */
const char* ErrorCodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or configuration
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating a missing input (file, replica, ...)
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating a benchmark phase exceeded its deadline
 */
class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
    explicit TimeoutError(const char* message)
        : Error(message, Code::TIMEOUT) {}
};

/**
 * @brief Replica unreachable or credentials rejected. Never retried.
 */
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message)
        : Error(message, Code::CONNECTION) {}
    explicit ConnectionError(const char* message)
        : Error(message, Code::CONNECTION) {}
};

/**
 * @brief Statement rejected by the replica
 */
class StatementError : public Error {
public:
    explicit StatementError(const std::string& message)
        : Error(message, Code::STATEMENT) {}
    explicit StatementError(const char* message)
        : Error(message, Code::STATEMENT) {}
};

/**
 * @brief Operation attempted on a connection that was already closed
 */
class UseAfterCloseError : public Error {
public:
    explicit UseAfterCloseError(const std::string& message)
        : Error(message, Code::USE_AFTER_CLOSE) {}
    explicit UseAfterCloseError(const char* message)
        : Error(message, Code::USE_AFTER_CLOSE) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace tpch

#endif // TPCH_CORE_ERROR_H_

/**
 * @file TransactionException.hpp
 * @brief Base exception class for failures inside a tcptx transaction.
 */

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tcptx
{

/**
 * @brief Category of a transaction failure.
 * @ingroup exceptions
 *
 * Every failure a transaction can produce falls into exactly one of these categories. The
 * category is what callers branch on; the message only serves diagnostics.
 */
enum class ErrorKind
{
    InvalidInput,   ///< Malformed address, port, empty payload or empty buffer. No socket was opened.
    ConnectTimeout, ///< The connect phase did not complete within its deadline.
    SendTimeout,    ///< The separate send phase did not complete within its deadline.
    ReceiveTimeout, ///< No reply arrived within the receive deadline.
    Transport       ///< Any other socket-level failure (refused, reset, unreachable, ...).
};

/**
 * @brief Diagnostic prefix for an error category, e.g. `"connect timeout"`.
 * @ingroup exceptions
 */
[[nodiscard]] constexpr std::string_view toString(const ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::InvalidInput:
            return "invalid input";
        case ErrorKind::ConnectTimeout:
            return "connect timeout";
        case ErrorKind::SendTimeout:
            return "send timeout";
        case ErrorKind::ReceiveTimeout:
            return "receive timeout";
        case ErrorKind::Transport:
            return "transport error";
    }
    return "unknown error";
}

/**
 * @class TransactionException
 * @ingroup exceptions
 * @brief Represents any failure that ends a tcptx transaction.
 *
 * TransactionException is the root of the exception types thrown inside a transaction. It
 * carries the failure category (@ref ErrorKind), an optional platform error code
 * (`errno` or `WSAGetLastError()`), and an optional nested exception.
 *
 * These exceptions never reach users of `TransactionClient`: the client catches them,
 * reports them and turns them into a failed `TransactionResult`. They are public so that
 * the lower layers (`Endpoint`, `TransactionSocket`, `PhaseSignal`) can be used and tested
 * on their own.
 *
 * ### Example
 * @code
 * try {
 *     const auto endpoint = tcptx::Endpoint::parse("300.1.1.1", 80);
 * } catch (const tcptx::TransactionException& ex) {
 *     std::cerr << toString(ex.getKind()) << ": " << ex.what() << std::endl;
 * }
 * @endcode
 *
 * @see InvalidInputException, PhaseTimeoutException, TransportException
 */
class TransactionException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs an exception with a message and no associated error code.
     *
     * @param kind    Failure category.
     * @param message A human-readable description of the error context.
     */
    TransactionException(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), _kind(kind), _errorCode(0)
    {
    }

    /**
     * @brief Constructs an exception with a platform-specific error code and message.
     *
     * The message passed to `std::runtime_error` has the form `"message (error code 111)"`.
     *
     * @param kind    Failure category.
     * @param code    Integer error code returned by the operating system.
     * @param message Descriptive error message describing the failure context.
     */
    TransactionException(const ErrorKind kind, const int code, const std::string& message)
        : std::runtime_error(buildErrorMessage(message, code)), _kind(kind), _errorCode(code)
    {
    }

    /**
     * @brief Constructs an exception that wraps an earlier one.
     *
     * Used when a lower-level failure is re-categorized, e.g. a `getaddrinfo()` error that
     * means the caller passed something that is not an IP literal.
     *
     * @param kind    Failure category.
     * @param message Descriptive message for the higher-level failure.
     * @param nested  The original cause, typically `std::current_exception()`.
     */
    TransactionException(const ErrorKind kind, const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _kind(kind), _errorCode(0), _nested(std::move(nested))
    {
    }

    /**
     * @brief Failure category of this exception.
     */
    [[nodiscard]] ErrorKind getKind() const noexcept { return _kind; }

    /**
     * @brief Platform error code captured at construction, or 0 when none applies.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief The nested exception captured at construction, if any.
     *
     * @return The original cause, or `nullptr` if none was provided.
     * @see std::rethrow_exception()
     */
    [[nodiscard]] std::exception_ptr getNestedException() const noexcept { return _nested; }

    ~TransactionException() override = default;

  private:
    ErrorKind _kind;            ///< Failure category.
    int _errorCode;             ///< Platform-specific error code (e.g., errno, WSA error).
    std::exception_ptr _nested; ///< Captured nested exception for chaining, if any.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace tcptx

/**
 * @file PhaseTimeoutException.hpp
 * @brief Exception classes for transaction phases that exceed their deadline.
 */

#pragma once

#include "common.hpp"
#include "TransactionException.hpp"

#include <chrono>
#include <string>

namespace tcptx
{

/**
 * @class PhaseTimeoutException
 * @ingroup exceptions
 * @brief A transaction phase did not complete before its deadline.
 *
 * Carries the platform timeout code (`WSAETIMEDOUT` on Windows, `ETIMEDOUT` on POSIX), the
 * phase that timed out and the timeout that elapsed. Use one of the concrete subclasses
 * to throw; catch this class to handle any timeout.
 *
 * ### Example
 * @code
 * try {
 *     // ...
 * } catch (const tcptx::PhaseTimeoutException& e) {
 *     std::cerr << toString(e.getPhase()) << " took longer than " << e.getTimeout().count() << " ms\n";
 * }
 * @endcode
 *
 * @see ConnectTimeoutException, SendTimeoutException, ReceiveTimeoutException
 */
class PhaseTimeoutException : public TransactionException
{
  public:
    /**
     * @brief Phase that exceeded its deadline.
     */
    [[nodiscard]] Phase getPhase() const noexcept { return _phase; }

    /**
     * @brief Deadline that elapsed, as configured for the phase.
     */
    [[nodiscard]] std::chrono::milliseconds getTimeout() const noexcept { return _timeout; }

  protected:
    PhaseTimeoutException(const ErrorKind kind, const Phase phase, const std::chrono::milliseconds timeout)
        : TransactionException(kind, TCPTX_TIMEOUT_CODE,
                               std::string(toString(phase)) + " timed out after " + std::to_string(timeout.count()) +
                                   " ms"),
          _phase(phase), _timeout(timeout)
    {
    }

  private:
    Phase _phase;
    std::chrono::milliseconds _timeout;
};

/**
 * @class ConnectTimeoutException
 * @ingroup exceptions
 * @brief The connection was not established (or, when bundled, the payload not written)
 *        within the connect timeout.
 */
class ConnectTimeoutException final : public PhaseTimeoutException
{
  public:
    explicit ConnectTimeoutException(const std::chrono::milliseconds timeout)
        : PhaseTimeoutException(ErrorKind::ConnectTimeout, Phase::Connect, timeout)
    {
    }
};

/**
 * @class SendTimeoutException
 * @ingroup exceptions
 * @brief The payload could not be handed to the transport within the send timeout.
 *
 * Only thrown when the send runs as its own phase (`SendMode::Separate`).
 */
class SendTimeoutException final : public PhaseTimeoutException
{
  public:
    explicit SendTimeoutException(const std::chrono::milliseconds timeout)
        : PhaseTimeoutException(ErrorKind::SendTimeout, Phase::Send, timeout)
    {
    }
};

/**
 * @class ReceiveTimeoutException
 * @ingroup exceptions
 * @brief No reply byte arrived within the receive timeout.
 */
class ReceiveTimeoutException final : public PhaseTimeoutException
{
  public:
    explicit ReceiveTimeoutException(const std::chrono::milliseconds timeout)
        : PhaseTimeoutException(ErrorKind::ReceiveTimeout, Phase::Receive, timeout)
    {
    }
};

} // namespace tcptx

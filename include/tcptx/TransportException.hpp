/**
 * @file TransportException.hpp
 * @brief Exception class for socket-level failures in tcptx.
 */

#pragma once

#include "TransactionException.hpp"

namespace tcptx
{

/**
 * @class TransportException
 * @ingroup exceptions
 * @brief A socket operation failed for a reason other than a timeout.
 *
 * Thrown for connection refusal, resets, unreachable networks, address-family mismatches and
 * every other error the OS reports while creating, connecting, writing to or reading from
 * the transaction socket. The OS error code and its text are part of the message.
 */
class TransportException final : public TransactionException
{
  public:
    explicit TransportException(const std::string& message) : TransactionException(ErrorKind::Transport, message) {}

    TransportException(const int code, const std::string& message)
        : TransactionException(ErrorKind::Transport, code, message)
    {
    }
};

} // namespace tcptx

/**
 * @file InvalidInputException.hpp
 * @brief Exception class for rejected transaction arguments.
 */

#pragma once

#include "TransactionException.hpp"

namespace tcptx
{

/**
 * @class InvalidInputException
 * @ingroup exceptions
 * @brief The caller passed arguments a transaction cannot run with.
 *
 * Raised before any socket is created: the address is not a numeric IPv4/IPv6 literal,
 * the port is outside 1–65535, the payload is empty, or the receive buffer has no
 * capacity. Also raised by `ClientConfig::validate()` for non-positive timeouts.
 *
 * The caller can always fix these; retrying with the same arguments never helps.
 */
class InvalidInputException final : public TransactionException
{
  public:
    explicit InvalidInputException(const std::string& message)
        : TransactionException(ErrorKind::InvalidInput, message)
    {
    }

    InvalidInputException(const std::string& message, std::exception_ptr nested)
        : TransactionException(ErrorKind::InvalidInput, message, std::move(nested))
    {
    }
};

} // namespace tcptx

/**
 * @file ClientConfig.hpp
 * @brief Tunable settings of a TransactionClient.
 */

#pragma once

#include "common.hpp"
#include "InvalidInputException.hpp"

#include <chrono>
#include <string>

namespace tcptx
{

/**
 * @brief How the payload write relates to the connect phase.
 * @ingroup core
 */
enum class SendMode
{
    /**
     * The payload is written as part of the connect phase and shares its deadline; there is
     * no send phase of its own. This is the default.
     */
    BundledWithConnect,

    /**
     * The payload is written in a distinct send phase with its own deadline
     * (@ref ClientConfig::sendTimeout) and its own timeout error.
     */
    Separate
};

/**
 * @struct ClientConfig
 * @ingroup core
 * @brief Settings a TransactionClient applies to every transaction it runs.
 *
 * All timeouts default to @ref DefaultPhaseTimeout (10 seconds). Tests usually shorten them:
 *
 * @code
 * tcptx::ClientConfig config;
 * config.connectTimeout = std::chrono::milliseconds{200};
 * config.receiveTimeout = std::chrono::milliseconds{200};
 * tcptx::TransactionClient client(log, config);
 * @endcode
 */
struct ClientConfig
{
    /// Deadline for the connect phase, including the payload write in SendMode::BundledWithConnect.
    std::chrono::milliseconds connectTimeout{DefaultPhaseTimeout};

    /// Deadline for the send phase. Only used in SendMode::Separate.
    std::chrono::milliseconds sendTimeout{DefaultPhaseTimeout};

    /// Deadline for the first reply bytes to arrive.
    std::chrono::milliseconds receiveTimeout{DefaultPhaseTimeout};

    SendMode sendMode{SendMode::BundledWithConnect};

    /// Also raise a blocking alert for every failure, in addition to the log line.
    bool showAlerts{false};

    /**
     * @brief Rejects settings no transaction could run with.
     * @throws InvalidInputException if any timeout is zero, negative or above @ref MaxPhaseTimeout.
     */
    void validate() const
    {
        checkTimeout("connectTimeout", connectTimeout);
        checkTimeout("sendTimeout", sendTimeout);
        checkTimeout("receiveTimeout", receiveTimeout);
    }

  private:
    static void checkTimeout(const char* name, const std::chrono::milliseconds value)
    {
        if (value.count() <= 0)
            throw InvalidInputException(std::string(name) + " must be positive, got " +
                                        std::to_string(value.count()) + " ms");

        if (value > MaxPhaseTimeout)
            throw InvalidInputException(std::string(name) + " must not exceed " +
                                        std::to_string(MaxPhaseTimeout.count()) + " ms, got " +
                                        std::to_string(value.count()) + " ms");
    }
};

} // namespace tcptx

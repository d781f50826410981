/**
 * @file TransactionClient.hpp
 * @brief One-shot TCP request/response transactions with per-phase timeouts.
 */

#pragma once

#include "ClientConfig.hpp"
#include "common.hpp"
#include "Reporter.hpp"
#include "TransactionException.hpp"

#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tcptx
{

/**
 * @struct TransactionResult
 * @ingroup core
 * @brief Outcome of one transaction.
 */
struct TransactionResult
{
    bool success{false};

    /// Reply bytes written to the front of the receive buffer. 0 on failure, and on success
    /// when the peer closed the connection without replying.
    std::size_t bytesReceived{0};

    /// Failure category; empty on success.
    std::optional<ErrorKind> error;

    /// Text of the exception that ended the transaction; empty on success.
    std::string errorDetail;
};

/**
 * @struct TransactionReply
 * @ingroup core
 * @brief Result of TransactionClient::executeAsync(), together with the buffer it filled.
 */
struct TransactionReply
{
    TransactionResult result;

    /// Receive buffer of the requested capacity, zero-padded after the reply.
    std::vector<char> buffer;

    /**
     * @brief Reply bytes with the trailing zero padding removed.
     *
     * Only meaningful when `result.success` is true.
     */
    [[nodiscard]] std::string_view payload() const noexcept { return trimTrailingZeros(buffer); }
};

/**
 * @class TransactionClient
 * @ingroup core
 * @brief Sends a payload to a TCP endpoint and reads the reply, over a fresh connection per call.
 *
 * Each call is one transaction:
 * 1. validate the address, port, payload and buffer (no socket is opened if this fails);
 * 2. open a non-blocking socket and connect, waiting at most `connectTimeout`;
 * 3. write the payload, within the connect deadline by default or in its own send phase
 *    (see @ref SendMode);
 * 4. read the reply with a single receive, waiting at most `receiveTimeout`;
 * 5. shut down and close the socket, whatever happened before.
 *
 * No exception leaves a transaction. Every failure is reported once through the
 * @ref Reporter and turned into `false` (or a failed @ref TransactionResult); the caller
 * decides whether to retry.
 *
 * ### Example
 * @code
 * tcptx::TransactionClient client([](const std::string& line) { std::clog << line << '\n'; });
 *
 * std::array<char, tcptx::DefaultReceiveBufferSize> reply{};
 * if (client.execute("127.0.0.1", 50000, "PING", reply))
 *     std::cout << tcptx::trimTrailingZeros(reply) << '\n';
 * @endcode
 *
 * ### Thread Safety
 * - All members are `const` and transactions share nothing but the reporter, so one client
 *   may run transactions from several threads at once. The reporter must cope with
 *   concurrent calls (see @ref LogReporter).
 */
class TransactionClient
{
  public:
    /**
     * @brief Creates a client reporting through @p log, with a reporter chosen by @ref makeReporter().
     *
     * @param log    Receives one line per failure; may be empty.
     * @param config Timeouts, send mode and alert flag.
     * @throws InvalidInputException if @p config is invalid.
     */
    explicit TransactionClient(LogCallback log = {}, ClientConfig config = {});

    /**
     * @brief Creates a client with an explicitly supplied reporter.
     *
     * `config.showAlerts` is ignored here: the reporter decides how failures are presented.
     *
     * @throws InvalidInputException if @p config is invalid or @p reporter is null.
     */
    TransactionClient(ClientConfig config, std::shared_ptr<Reporter> reporter);

    /**
     * @brief Runs one transaction and tells whether it succeeded.
     *
     * @param address       Numeric IPv4 or IPv6 address of the server.
     * @param port          Server port, 1–65535.
     * @param sendPayload   Bytes to send; must not be empty.
     * @param receiveBuffer Caller-owned buffer for the reply. On success it holds the reply
     *                      followed by zero bytes up to its size. On failure its contents are
     *                      unspecified.
     * @return `true` if the payload was sent and the reply (possibly empty) received.
     */
    [[nodiscard]] bool execute(std::string_view address, int port, std::string_view sendPayload,
                               std::span<char> receiveBuffer) const;

    /**
     * @brief Same as @ref execute(), returning the detailed outcome.
     */
    [[nodiscard]] TransactionResult transact(std::string_view address, int port, std::string_view sendPayload,
                                             std::span<char> receiveBuffer) const;

    /**
     * @brief Runs one transaction on a worker task.
     *
     * The arguments are copied into the task and a buffer of @p receiveCapacity bytes is
     * allocated for the reply, so nothing has to outlive the call. The client itself is
     * copied as well; it may be destroyed before the future is ready.
     *
     * @return A future that becomes ready when the transaction has ended. It never holds an
     *         exception for a failed transaction; check `result.success`.
     */
    [[nodiscard]] std::future<TransactionReply> executeAsync(std::string address, int port, std::string sendPayload,
                                                             std::size_t receiveCapacity = DefaultReceiveBufferSize) const;

    [[nodiscard]] const ClientConfig& getConfig() const noexcept { return _config; }

  private:
    std::size_t run(std::string_view address, int port, std::string_view sendPayload,
                    std::span<char> receiveBuffer) const;

    ClientConfig _config;
    std::shared_ptr<Reporter> _reporter;
};

} // namespace tcptx

/**
 * @file TransactionSocket.hpp
 * @brief Non-blocking TCP socket owned by a single tcptx transaction.
 */

#pragma once

#include "common.hpp"
#include "Endpoint.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace tcptx
{

/**
 * @class TransactionSocket
 * @ingroup core
 * @brief Non-blocking TCP stream socket that lives for exactly one transaction.
 *
 * The socket is created for the endpoint's address family in non-blocking mode, so every
 * operation either completes at once or reports that it would block; waiting is left to
 * @ref PhaseSignal, which applies the per-phase deadline.
 *
 * ### Lifetime
 * - Construction opens the descriptor; nothing else is ever connected through it.
 * - Destruction performs a graceful shutdown of both directions (when connected) and
 *   closes the descriptor, on every exit path, success or exception.
 * - @ref close() may be called explicitly; later calls and the destructor then do nothing.
 * - Move-only. A moved-from socket owns nothing.
 *
 * ### Example
 * @code
 * TransactionSocket socket(Endpoint::parse("127.0.0.1", 50000));
 * if (socket.startConnect())
 * {
 *     PhaseSignal connectDone(socket.getSocketFd(), Phase::Connect);
 *     if (!connectDone.waitFor(std::chrono::seconds{10}))
 *         throw ConnectTimeoutException(std::chrono::seconds{10});
 * }
 * socket.finishConnect();
 * @endcode
 *
 * ### Thread Safety
 * - Not thread-safe. A transaction uses its socket from one thread only.
 */
class TransactionSocket
{
  public:
    /**
     * @brief Opens a non-blocking stream socket for @p remote's address family.
     *
     * @param remote Endpoint the socket will connect to. Its address is copied.
     * @throws TransportException if the socket cannot be created or configured.
     */
    explicit TransactionSocket(const Endpoint& remote);

    /**
     * @brief Shuts down both directions and closes the descriptor.
     * @note Never throws; errors during release are ignored.
     */
    ~TransactionSocket() noexcept;

    TransactionSocket(const TransactionSocket&) = delete;
    TransactionSocket& operator=(const TransactionSocket&) = delete;

    TransactionSocket(TransactionSocket&& rhs) noexcept;
    TransactionSocket& operator=(TransactionSocket&& rhs) noexcept;

    /**
     * @brief Initiates the TCP handshake with the remote endpoint.
     *
     * @return `true` if the connect is still in progress and the caller must wait on the
     *         connect-phase signal before calling @ref finishConnect(); `false` if it
     *         completed immediately.
     * @throws TransportException if the connect fails at once (e.g. network unreachable).
     */
    [[nodiscard]] bool startConnect();

    /**
     * @brief Confirms the outcome of a connect started with @ref startConnect().
     *
     * Reads `SO_ERROR`, which holds the result of an asynchronous handshake.
     *
     * @throws TransportException if the connection was refused, reset or otherwise failed.
     */
    void finishConnect();

    /**
     * @brief Writes as much of @p data as the kernel accepts right now.
     *
     * @return Number of bytes written; 0 if the send buffer is full and the caller should wait
     *         on the send-phase signal.
     * @throws TransportException on any error other than "would block".
     */
    [[nodiscard]] std::size_t trySend(std::string_view data) const;

    /**
     * @brief Reads whatever reply bytes are available into @p buffer, in a single receive.
     *
     * @return The number of bytes read (0 means the peer closed the connection without
     *         replying), or `std::nullopt` if nothing has arrived yet and the caller should
     *         wait on the receive-phase signal.
     * @throws TransportException on any error other than "would block".
     */
    [[nodiscard]] std::optional<std::size_t> tryReceive(std::span<char> buffer) const;

    /**
     * @brief Gracefully shuts down (when connected) and closes the socket.
     *
     * Safe to call more than once; only the first call releases anything.
     *
     * @throws TransportException if closing the descriptor fails.
     */
    void close();

    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    [[nodiscard]] bool isOpen() const noexcept { return _sockFd != INVALID_SOCKET; }

    [[nodiscard]] bool isConnected() const noexcept { return _isConnected; }

    /**
     * @brief The endpoint this socket connects to, as `"address:port"`.
     */
    [[nodiscard]] const std::string& getRemoteSocketAddress() const noexcept { return _remoteName; }

  private:
    void setNonBlocking(bool nonBlocking) const;
    void shutdownBoth() const noexcept;
    void cleanup() noexcept;
    [[noreturn]] void cleanupAndThrow(int errorCode, const std::string& context);

    SOCKET _sockFd = INVALID_SOCKET;
    sockaddr_storage _remoteAddr{};
    socklen_t _remoteAddrLen{0};
    std::string _remoteName;
    bool _isConnected = false;
};

} // namespace tcptx

/**
 * @file common.hpp
 * @brief Common platform and utility includes for tcptx.
 */

#pragma once

#include "TransportException.hpp"

#include <chrono>
#include <cstddef> // std::size_t
#include <cstdint>
#include <cstring> // std::memcpy()
#include <memory>
#include <span>
#include <string>
#include <string_view>

#ifdef _WIN32

// Do not reorder includes here, because Windows headers have specific order requirements.
// clang-format off
#include <winsock2.h> // Must come first: socket, connect, send, recv, etc.
#include <ws2tcpip.h> // TCP/IP functions: getaddrinfo, getnameinfo, inet_ntop, inet_pton
#include <windows.h>  // General Windows headers (e.g., FormatMessageA)
// clang-format on

#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib") // Winsock library
#endif

#else

// Assuming Linux
#include <arpa/inet.h>   //inet_ntop
#include <cerrno>        //errno
#include <fcntl.h>       //fcntl
#include <netdb.h>       //addrinfo
#include <netinet/in.h>  //sockaddr_in, sockaddr_in6
#include <netinet/tcp.h> //TCP_NODELAY
#include <poll.h>        //poll
#include <sys/socket.h>  //socket
#include <sys/types.h>   //socket
#include <unistd.h>      //close

#endif

/**
 * @defgroup tcptx tcptx: bounded TCP request/response transactions
 * @brief All core classes and functions of the tcptx library.
 *
 * tcptx performs exactly one connect→send→receive exchange per call over a fresh TCP
 * connection, with an independent deadline on every phase, and reports failures through an
 * injected reporter instead of letting them escape to the caller.
 *
 * Example usage:
 * @code
 * #include <tcptx/TransactionClient.hpp>
 * @endcode
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup tcptx
 * @brief Platform abstractions and small helpers shared by every tcptx component.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup tcptx
 * @brief Implementation-only utilities for internal use.
 *
 * @warning Do not rely on this module from user code. It is subject to change without notice.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup tcptx
 * @brief Exception types used inside a transaction before they are converted into a result.
 */

/**
 * @namespace tcptx
 * @brief Single-shot TCP transactions with per-phase timeouts.
 *
 * Core classes:
 * - TransactionClient: validates input and runs one transaction per call
 * - TransactionSocket: RAII stream socket owned by exactly one transaction
 * - PhaseSignal: bounded wait for completion of one phase (connect, send, receive)
 * - Reporter: injected diagnostics sink (log-only or blocking alert)
 *
 * @note A TransactionClient may be shared between threads. Everything a transaction touches
 *       (socket, phase signals, receive buffer) is private to that transaction.
 */
namespace tcptx
{
#ifdef _WIN32

typedef long ssize_t;

inline int InitSockets()
{
    WSADATA WSAData;
    return WSAStartup(MAKEWORD(2, 2), &WSAData);
}

inline int CleanupSockets()
{
    return WSACleanup();
}

inline int GetSocketError()
{
    return WSAGetLastError();
}

// NOLINTNEXTLINE(misc-const-correctness) - changes socket state
inline int CloseSocket(SOCKET fd)
{
    return closesocket(fd);
}

inline int PollSockets(pollfd* fds, const unsigned long count, const int timeoutMillis)
{
    return WSAPoll(fds, count, timeoutMillis);
}

#define TCPTX_TIMEOUT_CODE WSAETIMEDOUT

#else

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

#define TCPTX_TIMEOUT_CODE ETIMEDOUT

constexpr int InitSockets()
{
    return 0;
}
constexpr int CleanupSockets()
{
    return 0;
}
inline int GetSocketError()
{
    return errno;
}
inline int CloseSocket(const SOCKET fd)
{
    return close(fd);
}
inline int PollSockets(pollfd* fds, const nfds_t count, const int timeoutMillis)
{
    return ::poll(fds, count, timeoutMillis);
}

#endif

/**
 * @brief Convert a socket-related error code to a human-readable message.
 *
 * @details
 * Handles both the errno/WSAGetLastError() domain and the EAI_* domain returned by
 * getaddrinfo(). Pass @p gaiStrerror = true for the latter.
 *
 * - Windows: FormatMessageA for system and WSA* codes, gai_strerrorA for EAI_* codes.
 * - POSIX: std::system_category().message() for errno values, gai_strerror() for EAI_* codes.
 *
 * @param[in] error Numeric error code.
 * @param[in] gaiStrerror true if @p error comes from getaddrinfo()/getnameinfo().
 * @return A best-effort description, or an empty string when @p error is zero.
 *
 * @note Never throws. Falls back to "Unknown error <code>".
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @brief The three sequential phases of a transaction.
 * @ingroup core
 */
enum class Phase
{
    Connect, ///< TCP handshake (and, by default, the payload write)
    Send,    ///< Payload write, when run as its own phase
    Receive  ///< Single read of the reply into the caller's buffer
};

/**
 * @brief Lower-case name of a phase, as used in diagnostics ("connect", "send", "receive").
 * @ingroup core
 */
[[nodiscard]] constexpr std::string_view toString(const Phase phase) noexcept
{
    switch (phase)
    {
        case Phase::Connect:
            return "connect";
        case Phase::Send:
            return "send";
        case Phase::Receive:
            return "receive";
    }
    return "unknown";
}

/**
 * @typedef Port
 * @brief Type alias representing a TCP port number (1–65535).
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Default capacity (in bytes) of a reply buffer allocated on the caller's behalf.
 * @ingroup core
 *
 * Replies are read with a single receive into a buffer of fixed capacity; bytes beyond it
 * are left unread.
 *
 * @see TransactionClient::executeAsync()
 */
inline constexpr std::size_t DefaultReceiveBufferSize = 1024;

/**
 * @brief Default deadline applied to each transaction phase.
 * @ingroup core
 */
inline constexpr std::chrono::milliseconds DefaultPhaseTimeout{10000};

/**
 * @brief Longest deadline accepted for a transaction phase (24 hours).
 * @ingroup core
 *
 * A phase deadline is computed as `steady_clock::now() + timeout` in the clock's
 * nanosecond ticks; larger values would overflow that addition.
 *
 * @see ClientConfig::validate()
 */
inline constexpr std::chrono::milliseconds MaxPhaseTimeout = std::chrono::hours{24};

/**
 * @brief Returns @p buffer without its trailing zero bytes.
 * @ingroup core
 *
 * A successful transaction pads the receive buffer with `'\0'` up to its capacity. This
 * strips that padding so the caller sees only the reply bytes.
 *
 * @note A reply that itself ends in zero bytes cannot be told apart from padding; use
 *       TransactionResult::bytesReceived when that matters.
 */
[[nodiscard]] inline std::string_view trimTrailingZeros(const std::span<const char> buffer) noexcept
{
    std::size_t len = buffer.size();
    while (len > 0 && buffer[len - 1] == '\0')
        --len;
    return {buffer.data(), len};
}

} // namespace tcptx

namespace tcptx::internal
{

/**
 * @struct AddrinfoDeleter
 * @brief Custom deleter for `addrinfo*` pointers, calling `freeaddrinfo()`.
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @typedef AddrinfoPtr
 * @brief Smart pointer that manages `addrinfo*` resources using `AddrinfoDeleter`.
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Converts a numeric IP literal and port into a list of `addrinfo` structures.
 * @ingroup internal
 *
 * Wraps `::getaddrinfo()` with `AI_NUMERICHOST | AI_NUMERICSERV`, so no DNS or service
 * lookup ever happens: a host name such as `"localhost"` fails with `EAI_NONAME`.
 * Both IPv4 and IPv6 literals are accepted (`AF_UNSPEC`), including IPv6 scope ids
 * (`"fe80::1%eth0"`).
 *
 * @param[in] host Numeric IPv4 or IPv6 address.
 * @param[in] port Port number.
 * @return RAII-managed list; the first entry is the one to use.
 *
 * @throws TransportException if @p host contains a NUL byte, or if `getaddrinfo()` fails
 *         (carrying the EAI_* code and its text).
 */
[[nodiscard]] inline AddrinfoPtr resolveNumericAddress(const std::string_view host, const Port port)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    if (host.find('\0') != std::string_view::npos)
        throw TransportException("host contains a NUL byte");

    // getaddrinfo() needs a NUL-terminated host; string_view gives no such guarantee
    const std::string hostStr(host);
    const std::string portStr = std::to_string(port);
    addrinfo* raw = nullptr;

    if (const int ret = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &raw); ret != 0)
    {
        throw TransportException(ret, SocketErrorMessage(ret, true));
    }

    return AddrinfoPtr{raw};
}

} // namespace tcptx::internal

#include "tcptx/TransactionSocket.hpp"

#include <utility>

using namespace tcptx;

namespace
{

bool isWouldBlock(const int error)
{
#ifdef _WIN32
    return error == WSAEWOULDBLOCK || error == WSAEINPROGRESS;
#else
    return error == EWOULDBLOCK || error == EAGAIN || error == EINPROGRESS;
#endif
}

} // namespace

TransactionSocket::TransactionSocket(const Endpoint& remote)
    : _remoteAddrLen(remote.getSockAddrLen()), _remoteName(remote.toString())
{
    std::memcpy(&_remoteAddr, remote.getSockAddr(), static_cast<std::size_t>(remote.getSockAddrLen()));

    _sockFd = ::socket(remote.getFamily(), SOCK_STREAM, IPPROTO_TCP);
    if (_sockFd == INVALID_SOCKET)
        cleanupAndThrow(GetSocketError(), "socket() failed");

    try
    {
        setNonBlocking(true);

        // Payloads are small; send them without Nagle delay.
        const int noDelay = 1;
        if (::setsockopt(_sockFd, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&noDelay),
                         sizeof(noDelay)) == SOCKET_ERROR)
        {
            const int error = GetSocketError();
            throw TransportException(error, "setsockopt(TCP_NODELAY) failed: " + SocketErrorMessage(error));
        }
    }
    catch (const TransportException&)
    {
        cleanup();
        throw;
    }
}

TransactionSocket::~TransactionSocket() noexcept
{
    cleanup();
}

TransactionSocket::TransactionSocket(TransactionSocket&& rhs) noexcept
    : _sockFd(std::exchange(rhs._sockFd, INVALID_SOCKET)), _remoteAddr(rhs._remoteAddr),
      _remoteAddrLen(rhs._remoteAddrLen), _remoteName(std::move(rhs._remoteName)),
      _isConnected(std::exchange(rhs._isConnected, false))
{
}

TransactionSocket& TransactionSocket::operator=(TransactionSocket&& rhs) noexcept
{
    if (this != &rhs)
    {
        cleanup();
        _sockFd = std::exchange(rhs._sockFd, INVALID_SOCKET);
        _remoteAddr = rhs._remoteAddr;
        _remoteAddrLen = rhs._remoteAddrLen;
        _remoteName = std::move(rhs._remoteName);
        _isConnected = std::exchange(rhs._isConnected, false);
    }
    return *this;
}

void TransactionSocket::setNonBlocking(const bool nonBlocking) const
{
#ifdef _WIN32
    u_long mode = nonBlocking ? 1 : 0;
    if (::ioctlsocket(_sockFd, FIONBIO, &mode) != 0)
    {
        const int error = GetSocketError();
        throw TransportException(error, SocketErrorMessage(error));
    }
#else
    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0)
        throw TransportException(errno, "fcntl(F_GETFL) failed");

    const int newFlags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(_sockFd, F_SETFL, newFlags) < 0)
        throw TransportException(errno, "fcntl(F_SETFL) failed");
#endif
}

bool TransactionSocket::startConnect()
{
    if (_sockFd == INVALID_SOCKET)
        throw TransportException("connect() called on a closed socket");

    if (_isConnected)
        throw TransportException("connect() called on an already-connected socket");

    const int res = ::connect(_sockFd, reinterpret_cast<const sockaddr*>(&_remoteAddr),
#ifdef _WIN32
                              static_cast<int>(_remoteAddrLen)
#else
                              _remoteAddrLen
#endif
    );

    if (res == 0)
    {
        _isConnected = true;
        return false;
    }

    const int error = GetSocketError();
    if (isWouldBlock(error))
        return true;

    throw TransportException(error, "connect to " + _remoteName + " failed: " + SocketErrorMessage(error));
}

void TransactionSocket::finishConnect()
{
    if (_isConnected)
        return;

    int soError = 0;
    socklen_t len = sizeof(soError);
    // SO_ERROR is always retrieved as int (POSIX & Windows agree on semantics)
    if (::getsockopt(_sockFd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw TransportException(error, "getsockopt(SO_ERROR) failed: " + SocketErrorMessage(error));
    }

    if (soError != 0)
        throw TransportException(soError, "connect to " + _remoteName + " failed: " + SocketErrorMessage(soError));

    _isConnected = true;
}

std::size_t TransactionSocket::trySend(const std::string_view data) const
{
    if (!_isConnected)
        throw TransportException("send() called on an unconnected socket");

    if (data.empty())
        return 0;

    int flags = 0;
#ifndef _WIN32
    flags = MSG_NOSIGNAL; // Prevent SIGPIPE on write to a closed socket (POSIX)
#endif
    const auto len = ::send(_sockFd, data.data(),
#ifdef _WIN32
                            static_cast<int>(data.size()),
#else
                            data.size(),
#endif
                            flags);

    if (len == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        if (isWouldBlock(error))
            return 0;
        throw TransportException(error, "send to " + _remoteName + " failed: " + SocketErrorMessage(error));
    }

    return static_cast<std::size_t>(len);
}

std::optional<std::size_t> TransactionSocket::tryReceive(const std::span<char> buffer) const
{
    if (!_isConnected)
        throw TransportException("recv() called on an unconnected socket");

    const auto len = ::recv(_sockFd, buffer.data(),
#ifdef _WIN32
                            static_cast<int>(buffer.size()),
#else
                            buffer.size(),
#endif
                            0);

    if (len == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        if (isWouldBlock(error))
            return std::nullopt;
        throw TransportException(error, "receive from " + _remoteName + " failed: " + SocketErrorMessage(error));
    }

    return static_cast<std::size_t>(len);
}

// The peer may already have reset the connection; the result is ignored.
void TransactionSocket::shutdownBoth() const noexcept
{
    if (_sockFd == INVALID_SOCKET || !_isConnected)
        return;

#ifdef _WIN32
    static_cast<void>(::shutdown(_sockFd, SD_BOTH));
#else
    static_cast<void>(::shutdown(_sockFd, SHUT_RDWR));
#endif
}

void TransactionSocket::close()
{
    if (_sockFd == INVALID_SOCKET)
        return;

    shutdownBoth();

    const SOCKET fd = std::exchange(_sockFd, INVALID_SOCKET);
    _isConnected = false;

    if (CloseSocket(fd))
    {
        const int error = GetSocketError();
        throw TransportException(error, "close failed: " + SocketErrorMessage(error));
    }
}

void TransactionSocket::cleanup() noexcept
{
    if (_sockFd == INVALID_SOCKET)
        return;

    shutdownBoth();

    // Close errors cannot be reported from a destructor; the descriptor is gone either way.
    CloseSocket(_sockFd);
    _sockFd = INVALID_SOCKET;
    _isConnected = false;
}

void TransactionSocket::cleanupAndThrow(const int errorCode, const std::string& context)
{
    cleanup();
    throw TransportException(errorCode, context + ": " + SocketErrorMessage(errorCode));
}

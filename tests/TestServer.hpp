// Loopback TCP server used by the tcptx GoogleTest suite
#pragma once

#include "tcptx/common.hpp"
#include "tcptx/SocketInitializer.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tcptx::test
{

/**
 * @brief A server on 127.0.0.1 (ephemeral port) that plays one of several peer behaviors.
 *
 * - Echo: replies with every byte it receives, until the client closes.
 * - Silent: accepts and reads, but never replies.
 * - CloseAfterRead: reads the request, then closes without replying.
 * - BacklogFull: never accepts; its accept queue is filled at construction so further
 *   handshakes stall (Linux drops SYNs to a listener whose accept queue is full).
 */
class TestServer
{
  public:
    enum class Mode
    {
        Echo,
        Silent,
        CloseAfterRead,
        BacklogFull
    };

    explicit TestServer(const Mode mode) : _mode(mode)
    {
        _listenFd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (_listenFd == INVALID_SOCKET)
            throw std::runtime_error("TestServer: socket() failed");

        const int reuse = 1;
        ::setsockopt(_listenFd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        socklen_t len = sizeof(addr);

        if (::bind(_listenFd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR ||
            ::listen(_listenFd, mode == Mode::BacklogFull ? 0 : 16) == SOCKET_ERROR ||
            ::getsockname(_listenFd, reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
        {
            CloseSocket(_listenFd);
            throw std::runtime_error("TestServer: bind/listen failed");
        }
        _port = ntohs(addr.sin_port);

        if (mode == Mode::BacklogFull)
            fillBacklog();
        else
            _thread = std::thread([this] { serve(); });
    }

    ~TestServer()
    {
        _stop = true;
        if (_thread.joinable())
            _thread.join();
        for (const SOCKET fd : _held)
            CloseSocket(fd);
        CloseSocket(_listenFd);
    }

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    [[nodiscard]] Port port() const noexcept { return _port; }

    /// Number of connections accepted so far.
    [[nodiscard]] int accepted() const noexcept { return _accepted.load(); }

  private:
    static constexpr int PollIntervalMillis = 20;

    void fillBacklog()
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(_port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        // The first connection completes and occupies the only queue slot; the second is left pending.
        for (int i = 0; i < 2; ++i)
        {
            const SOCKET fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
            if (fd == INVALID_SOCKET)
                throw std::runtime_error("TestServer: filler socket() failed");
#ifndef _WIN32
            if (i > 0)
                ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
#endif
            static_cast<void>(::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)));
            _held.push_back(fd);
        }
        // Let the kernel finish queueing the first handshake.
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    // Waits until fd is readable; returns false if the server is stopping.
    bool waitReadable(const SOCKET fd) const
    {
        while (!_stop)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            const int ret = PollSockets(&pfd, 1, PollIntervalMillis);
            if (ret > 0)
                return true;
            if (ret < 0)
                return false;
        }
        return false;
    }

    void serve()
    {
        while (waitReadable(_listenFd))
        {
            const SOCKET conn = ::accept(_listenFd, nullptr, nullptr);
            if (conn == INVALID_SOCKET)
                continue;
            ++_accepted;
            handle(conn);
        }
    }

    void handle(const SOCKET conn)
    {
        char buf[4096];
        switch (_mode)
        {
            case Mode::Echo:
                while (waitReadable(conn))
                {
                    const auto n = ::recv(conn, buf, sizeof(buf), 0);
                    if (n <= 0)
                        break;
#ifdef _WIN32
                    ::send(conn, buf, static_cast<int>(n), 0);
#else
                    ::send(conn, buf, static_cast<std::size_t>(n), MSG_NOSIGNAL);
#endif
                }
                CloseSocket(conn);
                break;
            case Mode::Silent:
                if (waitReadable(conn))
                    static_cast<void>(::recv(conn, buf, sizeof(buf), 0));
                _held.push_back(conn); // closed in the destructor, never answered
                break;
            case Mode::CloseAfterRead:
                if (waitReadable(conn))
                    static_cast<void>(::recv(conn, buf, sizeof(buf), 0));
                CloseSocket(conn);
                break;
            case Mode::BacklogFull:
                CloseSocket(conn);
                break;
        }
    }

    SocketInitializer _init;
    Mode _mode;
    SOCKET _listenFd = INVALID_SOCKET;
    Port _port = 0;
    std::atomic<bool> _stop{false};
    std::atomic<int> _accepted{0};
    std::vector<SOCKET> _held;
    std::thread _thread;
};

/**
 * @brief Returns a loopback port with nothing listening on it.
 */
inline Port closedPort()
{
    SocketInitializer init;
    const SOCKET fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    socklen_t len = sizeof(addr);
    ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    CloseSocket(fd);
    return ntohs(addr.sin_port);
}

} // namespace tcptx::test

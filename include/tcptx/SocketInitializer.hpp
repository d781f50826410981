/**
 * @file SocketInitializer.hpp
 * @brief RAII guard for the platform socket subsystem in tcptx.
 */

#pragma once

#include "common.hpp"
#include "TransportException.hpp"

#include <iostream>

namespace tcptx
{
/**
 * @brief Keeps the platform socket subsystem initialized for as long as it lives.
 *
 * On Windows, calls WSAStartup/WSACleanup; both are reference counted by Winsock, so every
 * transaction holds its own initializer and nested instances are harmless. On POSIX, does
 * nothing.
 */
class SocketInitializer
{
  public:
    /**
     * @brief Initialize the socket subsystem (WSAStartup on Windows).
     * @throws TransportException if initialization fails.
     */
    SocketInitializer()
    {
        if (const int error = InitSockets(); error != 0)
            throw TransportException(error, "socket subsystem initialization failed: " + SocketErrorMessage(error));
    }

    /**
     * @brief Release the socket subsystem (WSACleanup on Windows).
     * @note Failures are written to stderr, never thrown.
     */
    ~SocketInitializer() noexcept
    {
        if (CleanupSockets() != 0)
            std::cerr << "tcptx: socket subsystem cleanup failed: " << SocketErrorMessage(GetSocketError())
                      << std::endl;
    }

    SocketInitializer(const SocketInitializer& rhs) = delete;
    SocketInitializer& operator=(const SocketInitializer& rhs) = delete;
};

} // namespace tcptx

#include "tcptx/PhaseSignal.hpp"

#include <algorithm>
#include <limits>

using namespace tcptx;

PhaseSignal::PhaseSignal(const SOCKET sock, const Phase phase) noexcept : _sock(sock), _phase(phase) {}

bool PhaseSignal::waitFor(const std::chrono::milliseconds timeout) const
{
    return waitUntil(Clock::now() + timeout);
}

bool PhaseSignal::waitUntil(const Clock::time_point deadline) const
{
    if (_set)
        return true;

    if (_sock == INVALID_SOCKET)
        throw TransportException(std::string(toString(_phase)) + " wait on a closed socket");

    pollfd pfd{};
    pfd.fd = _sock;
    pfd.events = (_phase == Phase::Receive) ? POLLIN : POLLOUT;

    while (true)
    {
        const auto now = Clock::now();
        if (now >= deadline)
            return false;

        // Round up so a sub-millisecond remainder still waits instead of spinning.
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
        const int timeoutMillis =
            static_cast<int>(std::min<long long>(remaining, std::numeric_limits<int>::max()));

        pfd.revents = 0;
        const int result = PollSockets(&pfd, 1, timeoutMillis);

        if (result > 0)
            return true; // ready, or POLLERR/POLLHUP which the next socket call will report

        if (result == 0)
            continue; // re-check the deadline; poll() may return slightly early

        const int error = GetSocketError();
#ifndef _WIN32
        if (error == EINTR)
            continue;
#endif
        throw TransportException(error, std::string(toString(_phase)) + " wait failed: " + SocketErrorMessage(error));
    }
}

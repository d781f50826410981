/**
 * @file PhaseSignal.hpp
 * @brief Bounded wait for completion of one transaction phase.
 */

#pragma once

#include "common.hpp"

#include <chrono>

namespace tcptx
{

/**
 * @class PhaseSignal
 * @ingroup core
 * @brief Completion signal of a single asynchronous socket operation (connect, send or receive).
 *
 * A transaction starts each phase with a non-blocking socket call. When that call cannot
 * complete immediately, the transaction blocks on the phase's signal until the socket
 * becomes ready in the phase's direction (writable for connect and send, readable for
 * receive) or until the deadline passes, whichever comes first.
 *
 * Each transaction owns one signal per phase; signals are never shared between phases or
 * transactions. Once @ref set() has been called the phase is complete and any further
 * wait returns immediately.
 *
 * ### Example
 * @code
 * PhaseSignal receiveDone(socket.getSocketFd(), Phase::Receive);
 * auto received = socket.tryReceive(buffer);
 * while (!received)
 * {
 *     if (!receiveDone.waitFor(timeout))
 *         throw ReceiveTimeoutException(timeout);
 *     received = socket.tryReceive(buffer);
 * }
 * receiveDone.set();
 * @endcode
 *
 * @note A ready socket does not guarantee that the next operation succeeds: errors
 *       (refused, reset) also wake the wait and surface from the socket call that follows.
 */
class PhaseSignal
{
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param sock  Socket whose readiness completes the phase. Not owned.
     * @param phase Phase this signal belongs to; selects the readiness direction.
     */
    PhaseSignal(SOCKET sock, Phase phase) noexcept;

    PhaseSignal(const PhaseSignal&) = delete;
    PhaseSignal& operator=(const PhaseSignal&) = delete;

    /**
     * @brief Blocks until the phase can make progress or @p deadline passes.
     *
     * Interrupted waits (`EINTR`) are resumed with the time that is left, so the total wait
     * never exceeds the deadline.
     *
     * @param deadline Absolute point in time after which the wait gives up.
     * @return `true` if the socket is ready (or the phase was already set), `false` on timeout.
     * @throws TransportException if the underlying poll fails.
     */
    [[nodiscard]] bool waitUntil(Clock::time_point deadline) const;

    /**
     * @brief Same as @ref waitUntil() with a deadline of now + @p timeout.
     */
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    /**
     * @brief Marks the phase as complete.
     */
    void set() noexcept { _set = true; }

    [[nodiscard]] bool isSet() const noexcept { return _set; }

    [[nodiscard]] Phase getPhase() const noexcept { return _phase; }

  private:
    SOCKET _sock;
    Phase _phase;
    bool _set{false};
};

} // namespace tcptx

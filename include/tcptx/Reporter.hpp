/**
 * @file Reporter.hpp
 * @brief Injected sinks for transaction diagnostics.
 */

#pragma once

#include "ClientConfig.hpp"
#include "TransactionException.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace tcptx
{

/**
 * @brief Receives one human-readable line per failed transaction.
 * @ingroup core
 */
using LogCallback = std::function<void(const std::string& message)>;

/**
 * @brief Shows a failure to the user and returns once it has been acknowledged.
 * @ingroup core
 *
 * Implementations are expected to block, e.g. a modal dialog or a console prompt.
 */
using AlertPresenter = std::function<void(const std::string& title, const std::string& message)>;

/**
 * @class Reporter
 * @ingroup core
 * @brief Where a TransactionClient sends its failures.
 *
 * Reporting is a pure side effect: it never changes the outcome of a transaction. The
 * client calls @ref report() exactly once per failed transaction, possibly from several
 * threads at the same time when transactions run concurrently.
 *
 * @see LogReporter, AlertReporter, makeReporter()
 */
class Reporter
{
  public:
    virtual ~Reporter() = default;

    /**
     * @brief Reports one failed transaction.
     * @param kind   Failure category.
     * @param detail Underlying exception text.
     */
    virtual void report(ErrorKind kind, std::string_view detail) = 0;

    /**
     * @brief Builds the diagnostic line for a failure: `"<category>: <detail>"`.
     *
     * @code
     * Reporter::formatDiagnostic(ErrorKind::ReceiveTimeout, "receive timed out after 200 ms (error code 110)");
     * // "receive timeout: receive timed out after 200 ms (error code 110)"
     * @endcode
     */
    [[nodiscard]] static std::string formatDiagnostic(ErrorKind kind, std::string_view detail);
};

/**
 * @class LogReporter
 * @ingroup core
 * @brief Forwards each diagnostic line to a @ref LogCallback and does nothing else.
 *
 * An empty callback turns the reporter into a no-op. The callback is invoked without
 * locking; a callback shared between concurrent transactions must be thread-safe itself.
 */
class LogReporter : public Reporter
{
  public:
    explicit LogReporter(LogCallback log) : _log(std::move(log)) {}

    void report(ErrorKind kind, std::string_view detail) override;

  private:
    LogCallback _log;
};

/**
 * @class AlertReporter
 * @ingroup core
 * @brief Logs like @ref LogReporter, then raises a blocking alert for the same failure.
 *
 * Alerts are serialized: concurrent failures are presented one after the other, never
 * interleaved.
 */
class AlertReporter final : public LogReporter
{
  public:
    /**
     * @param log       Callback for the diagnostic line; may be empty.
     * @param presenter Blocking alert. If empty, @ref consoleAlertPresenter() on stderr/stdin is used.
     */
    AlertReporter(LogCallback log, AlertPresenter presenter);

    void report(ErrorKind kind, std::string_view detail) override;

    /**
     * @brief Dialog title used for a failure category.
     */
    [[nodiscard]] static std::string alertTitle(ErrorKind kind);

  private:
    AlertPresenter _presenter;
    std::mutex _alertMutex;
};

/**
 * @brief A blocking console alert: prints a framed message to @p out and waits for a line on @p in.
 * @ingroup core
 *
 * The streams must outlive every reporter holding the returned presenter.
 */
[[nodiscard]] AlertPresenter consoleAlertPresenter(std::ostream& out, std::istream& in);

/**
 * @brief Picks the reporter matching @p config.
 * @ingroup core
 *
 * @return An @ref AlertReporter when `config.showAlerts` is set, a @ref LogReporter otherwise.
 */
[[nodiscard]] std::shared_ptr<Reporter> makeReporter(const ClientConfig& config, LogCallback log,
                                                     AlertPresenter presenter = {});

} // namespace tcptx

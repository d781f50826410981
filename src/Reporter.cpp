#include "tcptx/Reporter.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

using namespace tcptx;

std::string Reporter::formatDiagnostic(const ErrorKind kind, const std::string_view detail)
{
    std::string line(toString(kind));
    line += ": ";
    line += detail;
    return line;
}

void LogReporter::report(const ErrorKind kind, const std::string_view detail)
{
    if (_log)
        _log(formatDiagnostic(kind, detail));
}

AlertReporter::AlertReporter(LogCallback log, AlertPresenter presenter)
    : LogReporter(std::move(log)),
      _presenter(presenter ? std::move(presenter) : consoleAlertPresenter(std::cerr, std::cin))
{
}

void AlertReporter::report(const ErrorKind kind, const std::string_view detail)
{
    LogReporter::report(kind, detail);

    const std::lock_guard lock(_alertMutex);
    _presenter(alertTitle(kind), std::string(detail));
}

std::string AlertReporter::alertTitle(const ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::InvalidInput:
            return "Invalid input";
        case ErrorKind::ConnectTimeout:
        case ErrorKind::SendTimeout:
        case ErrorKind::ReceiveTimeout:
            return "Timeout";
        case ErrorKind::Transport:
            return "Transport error";
    }
    return "Error";
}

AlertPresenter tcptx::consoleAlertPresenter(std::ostream& out, std::istream& in)
{
    return [&out, &in](const std::string& title, const std::string& message)
    {
        const std::string rule(std::max(title.size(), message.size()) + 4, '=');
        out << '\n' << rule << "\n  " << title << "\n  " << message << '\n' << rule << '\n';
        out << "Press Enter to continue..." << std::flush;

        std::string ignored;
        std::getline(in, ignored);
    };
}

std::shared_ptr<Reporter> tcptx::makeReporter(const ClientConfig& config, LogCallback log, AlertPresenter presenter)
{
    if (config.showAlerts)
        return std::make_shared<AlertReporter>(std::move(log), std::move(presenter));
    return std::make_shared<LogReporter>(std::move(log));
}

#include "tcptx/TransactionClient.hpp"

#include "tcptx/Endpoint.hpp"
#include "tcptx/InvalidInputException.hpp"
#include "tcptx/PhaseSignal.hpp"
#include "tcptx/PhaseTimeoutException.hpp"
#include "tcptx/SocketInitializer.hpp"
#include "tcptx/TransactionSocket.hpp"

#include <algorithm>
#include <utility>

using namespace tcptx;

namespace
{

using Clock = PhaseSignal::Clock;

// Returns false if the deadline passed before every byte was handed to the kernel.
bool writePayload(const TransactionSocket& socket, const std::string_view payload, PhaseSignal& sendDone,
                  const Clock::time_point deadline)
{
    std::size_t sent = 0;
    while (sent < payload.size())
    {
        if (const std::size_t n = socket.trySend(payload.substr(sent)); n > 0)
        {
            sent += n;
            continue;
        }

        if (!sendDone.waitUntil(deadline))
            return false;
    }

    sendDone.set();
    return true;
}

} // namespace

TransactionClient::TransactionClient(LogCallback log, ClientConfig config)
    : _config(std::move(config)), _reporter(makeReporter(_config, std::move(log)))
{
    _config.validate();
}

TransactionClient::TransactionClient(ClientConfig config, std::shared_ptr<Reporter> reporter)
    : _config(std::move(config)), _reporter(std::move(reporter))
{
    _config.validate();

    if (!_reporter)
        throw InvalidInputException("TransactionClient requires a reporter");
}

bool TransactionClient::execute(const std::string_view address, const int port, const std::string_view sendPayload,
                                const std::span<char> receiveBuffer) const
{
    return transact(address, port, sendPayload, receiveBuffer).success;
}

TransactionResult TransactionClient::transact(const std::string_view address, const int port,
                                              const std::string_view sendPayload,
                                              const std::span<char> receiveBuffer) const
{
    TransactionResult result;
    try
    {
        result.bytesReceived = run(address, port, sendPayload, receiveBuffer);
        result.success = true;
        return result;
    }
    catch (const TransactionException& ex)
    {
        result.error = ex.getKind();
        result.errorDetail = ex.what();
    }
    catch (const std::exception& ex)
    {
        result.error = ErrorKind::Transport;
        result.errorDetail = ex.what();
    }

    _reporter->report(*result.error, result.errorDetail);
    return result;
}

std::future<TransactionReply> TransactionClient::executeAsync(std::string address, const int port,
                                                              std::string sendPayload,
                                                              const std::size_t receiveCapacity) const
{
    return std::async(std::launch::async,
                      [client = *this, address = std::move(address), port, payload = std::move(sendPayload),
                       receiveCapacity]
                      {
                          TransactionReply reply;
                          reply.buffer.assign(receiveCapacity, '\0');
                          reply.result = client.transact(address, port, payload, reply.buffer);
                          return reply;
                      });
}

std::size_t TransactionClient::run(const std::string_view address, const int port, const std::string_view sendPayload,
                                   const std::span<char> receiveBuffer) const
{
    const Endpoint remote = Endpoint::parse(address, port);

    if (sendPayload.empty())
        throw InvalidInputException("there is no data to send");

    if (receiveBuffer.empty())
        throw InvalidInputException("receive buffer has no capacity");

    const SocketInitializer init;
    // Shut down and closed by its destructor on every exit path below.
    TransactionSocket socket(remote);

    const auto connectDeadline = Clock::now() + _config.connectTimeout;
    PhaseSignal connectDone(socket.getSocketFd(), Phase::Connect);
    if (socket.startConnect() && !connectDone.waitUntil(connectDeadline))
        throw ConnectTimeoutException(_config.connectTimeout);
    socket.finishConnect();
    connectDone.set();

    PhaseSignal sendDone(socket.getSocketFd(), Phase::Send);
    if (_config.sendMode == SendMode::BundledWithConnect)
    {
        if (!writePayload(socket, sendPayload, sendDone, connectDeadline))
            throw ConnectTimeoutException(_config.connectTimeout);
    }
    else if (!writePayload(socket, sendPayload, sendDone, Clock::now() + _config.sendTimeout))
    {
        throw SendTimeoutException(_config.sendTimeout);
    }

    const auto receiveDeadline = Clock::now() + _config.receiveTimeout;
    PhaseSignal receiveDone(socket.getSocketFd(), Phase::Receive);
    auto received = socket.tryReceive(receiveBuffer);
    while (!received)
    {
        if (!receiveDone.waitUntil(receiveDeadline))
            throw ReceiveTimeoutException(_config.receiveTimeout);
        received = socket.tryReceive(receiveBuffer);
    }
    receiveDone.set();

    std::fill(receiveBuffer.begin() + static_cast<std::ptrdiff_t>(*received), receiveBuffer.end(), '\0');
    return *received;
}

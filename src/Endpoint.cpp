#include "tcptx/Endpoint.hpp"

#include "tcptx/InvalidInputException.hpp"

#include <limits>

using namespace tcptx;

Endpoint::Endpoint(std::string address, const Port port, const addrinfo& resolved)
    : _address(std::move(address)), _port(port)
{
    std::memcpy(&_storage, resolved.ai_addr, resolved.ai_addrlen);
    _storageLen = static_cast<socklen_t>(resolved.ai_addrlen);
}

Endpoint Endpoint::parse(const std::string_view address, const int port)
{
    if (address.empty())
        throw InvalidInputException("IP address is empty");

    if (address.find('\0') != std::string_view::npos)
        throw InvalidInputException("IP address contains a NUL byte");

    if (port <= 0 || port > std::numeric_limits<Port>::max())
        throw InvalidInputException("port " + std::to_string(port) + " is out of range (1-65535)");

    // getaddrinfo() also takes classful forms such as "10.1" or "1.2.3"; only dotted quads are accepted here.
    if (address.find(':') == std::string_view::npos)
    {
        in_addr ipv4{};
        if (::inet_pton(AF_INET, std::string(address).c_str(), &ipv4) != 1)
            throw InvalidInputException("'" + std::string(address) + "' is not a valid IP address");
    }

    internal::AddrinfoPtr resolved;
    try
    {
        resolved = internal::resolveNumericAddress(address, static_cast<Port>(port));
    }
    catch (const TransportException&)
    {
        throw InvalidInputException("'" + std::string(address) + "' is not a valid IP address",
                                    std::current_exception());
    }

    if (!resolved || resolved->ai_addr == nullptr || resolved->ai_addrlen > sizeof(sockaddr_storage))
        throw InvalidInputException("'" + std::string(address) + "' is not a valid IP address");

    return {std::string(address), static_cast<Port>(port), *resolved};
}

std::string Endpoint::toString() const
{
    if (getFamily() == AF_INET6)
        return "[" + _address + "]:" + std::to_string(_port);
    return _address + ":" + std::to_string(_port);
}

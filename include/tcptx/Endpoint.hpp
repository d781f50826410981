/**
 * @file Endpoint.hpp
 * @brief Validated remote address for a tcptx transaction.
 */

#pragma once

#include "common.hpp"

#include <string>
#include <string_view>

namespace tcptx
{

/**
 * @class Endpoint
 * @ingroup core
 * @brief A numeric IP address and port that a transaction can connect to.
 *
 * An Endpoint can only be obtained through @ref parse(), so holding one proves that the
 * address is a valid IPv4 or IPv6 literal and that the port is in range. The resolved
 * `sockaddr` is stored alongside the text, ready for `::socket()` and `::connect()`.
 *
 * No name resolution happens here: `"localhost"` or `"example.com"` are rejected exactly
 * like `"256.256.256.256"`.
 */
class Endpoint
{
  public:
    /**
     * @brief Validates @p address and @p port and builds an Endpoint from them.
     *
     * @param[in] address Numeric IPv4 (`"127.0.0.1"`) or IPv6 (`"::1"`, `"fe80::1%eth0"`) literal.
     * @param[in] port    Port number; must be in 1–65535.
     * @return The validated endpoint.
     *
     * @throws InvalidInputException if the address is not a numeric IP literal or the port is out of range.
     *         For a bad address the `getaddrinfo()` failure is attached as nested exception.
     */
    [[nodiscard]] static Endpoint parse(std::string_view address, int port);

    /**
     * @brief The address exactly as given to @ref parse().
     */
    [[nodiscard]] const std::string& getAddress() const noexcept { return _address; }

    [[nodiscard]] Port getPort() const noexcept { return _port; }

    /**
     * @brief `AF_INET` or `AF_INET6`, as detected from the literal.
     */
    [[nodiscard]] int getFamily() const noexcept { return _storage.ss_family; }

    [[nodiscard]] const sockaddr* getSockAddr() const noexcept { return reinterpret_cast<const sockaddr*>(&_storage); }

    [[nodiscard]] socklen_t getSockAddrLen() const noexcept { return _storageLen; }

    /**
     * @brief `"address:port"`, with IPv6 addresses in brackets (`"[::1]:8080"`).
     */
    [[nodiscard]] std::string toString() const;

  private:
    Endpoint(std::string address, Port port, const addrinfo& resolved);

    std::string _address;
    Port _port;
    sockaddr_storage _storage{};
    socklen_t _storageLen{0};
};

} // namespace tcptx

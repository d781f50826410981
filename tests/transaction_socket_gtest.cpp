// GoogleTest unit tests for tcptx endpoints, sockets and phase signals
#include "TestServer.hpp"
#include "tcptx/Endpoint.hpp"
#include "tcptx/InvalidInputException.hpp"
#include "tcptx/PhaseSignal.hpp"
#include "tcptx/SocketInitializer.hpp"
#include "tcptx/TransactionSocket.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

using namespace tcptx;
using tcptx::test::TestServer;
using namespace std::chrono_literals;

TEST(EndpointTest, ParsesIpv4)
{
    const Endpoint ep = Endpoint::parse("127.0.0.1", 8080);
    EXPECT_EQ(ep.getAddress(), "127.0.0.1");
    EXPECT_EQ(ep.getPort(), 8080);
    EXPECT_EQ(ep.getFamily(), AF_INET);
    EXPECT_EQ(ep.getSockAddrLen(), static_cast<socklen_t>(sizeof(sockaddr_in)));
    EXPECT_EQ(ep.toString(), "127.0.0.1:8080");
}

TEST(EndpointTest, ParsesIpv6)
{
    const Endpoint ep = Endpoint::parse("::1", 65535);
    EXPECT_EQ(ep.getFamily(), AF_INET6);
    EXPECT_EQ(ep.getPort(), 65535);
    EXPECT_EQ(ep.toString(), "[::1]:65535");
}

TEST(EndpointTest, RejectsInvalidAddress)
{
    try
    {
        static_cast<void>(Endpoint::parse("256.256.256.256", 80));
        FAIL() << "expected InvalidInputException";
    }
    catch (const InvalidInputException& e)
    {
        EXPECT_EQ(e.getKind(), ErrorKind::InvalidInput);
        EXPECT_NE(std::string(e.what()).find("256.256.256.256"), std::string::npos);
    }

    EXPECT_THROW(static_cast<void>(Endpoint::parse("", 80)), InvalidInputException);
    EXPECT_THROW(static_cast<void>(Endpoint::parse("10.1", 80)), InvalidInputException);
    EXPECT_THROW(static_cast<void>(Endpoint::parse("fe80::1::2", 80)), InvalidInputException);
}

TEST(EndpointTest, NestsResolverError)
{
    try
    {
        static_cast<void>(Endpoint::parse("::zz", 80));
        FAIL() << "expected InvalidInputException";
    }
    catch (const InvalidInputException& e)
    {
        ASSERT_TRUE(e.getNestedException());
        EXPECT_THROW(std::rethrow_exception(e.getNestedException()), TransportException);
    }
}

TEST(EndpointTest, RejectsEmbeddedNul)
{
    using namespace std::string_view_literals;
    EXPECT_THROW(static_cast<void>(Endpoint::parse("127.0.0.1\0junk"sv, 80)), InvalidInputException);
    EXPECT_THROW(static_cast<void>(Endpoint::parse("::1\0"sv, 80)), InvalidInputException);
    EXPECT_THROW(static_cast<void>(internal::resolveNumericAddress("::1\0junk"sv, 80)), TransportException);
}

#ifndef _WIN32
TEST(EndpointTest, ResolverErrorTextIsPreserved)
{
    EXPECT_EQ(SocketErrorMessage(EAI_NONAME, true), std::string(::gai_strerror(EAI_NONAME)));

    try
    {
        static_cast<void>(internal::resolveNumericAddress("::zz", 80));
        FAIL() << "expected TransportException";
    }
    catch (const TransportException& e)
    {
        EXPECT_NE(e.getErrorCode(), 0);
        EXPECT_NE(std::string(e.what()).find(::gai_strerror(e.getErrorCode())), std::string::npos) << e.what();
    }
}
#endif

TEST(EndpointTest, RejectsPortOutOfRange)
{
    EXPECT_THROW(static_cast<void>(Endpoint::parse("127.0.0.1", 0)), InvalidInputException);
    EXPECT_THROW(static_cast<void>(Endpoint::parse("127.0.0.1", 65536)), InvalidInputException);
    EXPECT_NO_THROW(static_cast<void>(Endpoint::parse("127.0.0.1", 1)));
}

TEST(TransactionSocketTest, ConnectRefused)
{
    SocketInitializer init;
    TransactionSocket s(Endpoint::parse("127.0.0.1", test::closedPort()));
    EXPECT_TRUE(s.isOpen());
    EXPECT_FALSE(s.isConnected());

    EXPECT_THROW(
        {
            if (s.startConnect())
            {
                PhaseSignal done(s.getSocketFd(), Phase::Connect);
                ASSERT_TRUE(done.waitFor(2s));
            }
            s.finishConnect();
        },
        TransportException);
    EXPECT_FALSE(s.isConnected());
}

TEST(TransactionSocketTest, ConnectSendReceive)
{
    TestServer server(TestServer::Mode::Echo);
    SocketInitializer init;
    TransactionSocket s(Endpoint::parse("127.0.0.1", server.port()));

    PhaseSignal connectDone(s.getSocketFd(), Phase::Connect);
    if (s.startConnect())
        ASSERT_TRUE(connectDone.waitFor(2s));
    s.finishConnect();
    EXPECT_TRUE(s.isConnected());
    EXPECT_EQ(s.getRemoteSocketAddress(), "127.0.0.1:" + std::to_string(server.port()));

    EXPECT_EQ(s.trySend("abc"), 3u);

    std::array<char, 8> buf{};
    PhaseSignal receiveDone(s.getSocketFd(), Phase::Receive);
    auto n = s.tryReceive(buf);
    while (!n)
    {
        ASSERT_TRUE(receiveDone.waitFor(2s));
        n = s.tryReceive(buf);
    }
    EXPECT_EQ(*n, 3u);
    EXPECT_EQ(std::string(buf.data(), *n), "abc");

    // Closing a connected socket shuts it down first; the echo side then sees end of stream.
    s.close();
    EXPECT_FALSE(s.isOpen());
    EXPECT_FALSE(s.isConnected());
    EXPECT_NO_THROW(s.close());
}

TEST(TransactionSocketTest, CloseIsIdempotentAndMoveTransfersOwnership)
{
    SocketInitializer init;
    TransactionSocket a(Endpoint::parse("127.0.0.1", 9));
    const SOCKET fd = a.getSocketFd();

    TransactionSocket b(std::move(a));
    EXPECT_EQ(b.getSocketFd(), fd);
    EXPECT_FALSE(a.isOpen()); // NOLINT(bugprone-use-after-move)

    b.close();
    EXPECT_FALSE(b.isOpen());
    EXPECT_NO_THROW(b.close());
}

TEST(PhaseSignalTest, TimesOutWithoutActivity)
{
    TestServer server(TestServer::Mode::Silent);
    SocketInitializer init;
    TransactionSocket s(Endpoint::parse("127.0.0.1", server.port()));
    PhaseSignal connectDone(s.getSocketFd(), Phase::Connect);
    if (s.startConnect())
        ASSERT_TRUE(connectDone.waitFor(2s));
    s.finishConnect();

    PhaseSignal receiveDone(s.getSocketFd(), Phase::Receive);
    EXPECT_EQ(receiveDone.getPhase(), Phase::Receive);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(receiveDone.waitFor(100ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_FALSE(receiveDone.isSet());
}

TEST(PhaseSignalTest, SetSignalReturnsImmediately)
{
    SocketInitializer init;
    TransactionSocket s(Endpoint::parse("127.0.0.1", 9));
    PhaseSignal receiveDone(s.getSocketFd(), Phase::Receive);
    receiveDone.set();
    EXPECT_TRUE(receiveDone.isSet());
    EXPECT_TRUE(receiveDone.waitFor(0ms));
}

TEST(PhaseSignalTest, InvalidSocketThrows)
{
    const PhaseSignal signal(INVALID_SOCKET, Phase::Send);
    EXPECT_THROW(static_cast<void>(signal.waitFor(10ms)), TransportException);
}

/**
 * @file test_network.cpp
 * @brief Unit tests for TcpTransport framing and connection dispatch.
 */

#include "network/transport.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <fcntl.h>

using namespace exec_sandbox;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

/// Echo server answering every frame with "echo:" + payload.
void serve_echo(TcpTransport& server) {
    server.serve([](std::shared_ptr<TcpConnection> connection) {
        auto request = connection->receive(2000);
        if (!request) return;
        auto reply = bytes("echo:");
        reply.insert(reply.end(), request->begin(), request->end());
        (void)connection->send(reply);
    });
}

}  // namespace

TEST(TcpTransportTest, ListenOnEphemeralPort) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    EXPECT_TRUE(server.is_listening());
    EXPECT_NE(server.bound_port(), 0);
}

TEST(TcpTransportTest, RequestResponseRoundTrip) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    serve_echo(server);

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port()).has_value());
    EXPECT_TRUE(client.is_connected());
    ASSERT_TRUE(client.send(bytes("ping")).has_value());

    auto reply = client.receive(2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(std::string(reply->begin(), reply->end()), "echo:ping");
}

TEST(TcpTransportTest, EmptyFrame) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    serve_echo(server);

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port()).has_value());
    ASSERT_TRUE(client.send({}).has_value());
    auto reply = client.receive(2000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(std::string(reply->begin(), reply->end()), "echo:");
}

TEST(TcpTransportTest, AcceptedSocketsAreCloseOnExec) {
    std::atomic<int> flags{-1};
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    server.serve([&flags](std::shared_ptr<TcpConnection> connection) {
        flags = ::fcntl(connection->fd(), F_GETFD);
    });

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port()).has_value());
    for (int i = 0; i < 200 && flags.load() == -1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_NE(flags.load(), -1);
    EXPECT_TRUE(flags.load() & FD_CLOEXEC);
}

TEST(TcpTransportTest, OversizedFrameRejectedBeforeSending) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    serve_echo(server);

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port()).has_value());
    std::vector<uint8_t> huge(kMaxFrameSize + 1, 'x');
    auto sent = client.send(huge);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().kind, ErrorKind::Parse);
}

TEST(TcpTransportTest, ReceiveTimesOutWithoutReply) {
    std::vector<std::shared_ptr<TcpConnection>> held;
    std::mutex held_mutex;
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    server.serve([&](std::shared_ptr<TcpConnection> connection) {
        std::lock_guard lock(held_mutex);
        held.push_back(std::move(connection));  // never answers
    });

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server.bound_port()).has_value());
    ASSERT_TRUE(client.send(bytes("hello")).has_value());
    EXPECT_FALSE(client.receive(100).has_value());
    server.stop_serving();
}

TEST(TcpTransportTest, ConnectToClosedPortFails) {
    TcpTransport probe;
    ASSERT_TRUE(probe.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    uint16_t port = probe.bound_port();
    probe.stop_serving();  // closes the listener

    TcpTransport client;
    EXPECT_FALSE(client.connect("127.0.0.1", port, 500).has_value());
    EXPECT_FALSE(client.is_connected());
}

TEST(TcpTransportTest, InvalidAddresses) {
    TcpTransport client;
    auto connected = client.connect("not-an-ip", 8002);
    ASSERT_FALSE(connected.has_value());
    EXPECT_EQ(connected.error().kind, ErrorKind::Config);

    TcpTransport server;
    EXPECT_FALSE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "999.0.0.1").has_value());
}

TEST(TcpTransportTest, ClientOperationsRequireConnection) {
    TcpTransport client;
    EXPECT_FALSE(client.send(bytes("x")).has_value());
    EXPECT_FALSE(client.receive(10).has_value());
}

TEST(TcpTransportTest, StopServingClosesListener) {
    TcpTransport server;
    ASSERT_TRUE(server.listen(0, TcpTransport::DEFAULT_BACKLOG, "127.0.0.1").has_value());
    serve_echo(server);
    server.stop_serving();
    EXPECT_FALSE(server.is_listening());
}

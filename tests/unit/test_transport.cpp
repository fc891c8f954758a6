/**
 * @file test_transport.cpp
 * @brief Tests for the length-prefixed TCP transport.
 */

#include "network/transport.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sandbox_orchestrator;
using sandbox_orchestrator::testing::wait_until;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

std::string text(const std::vector<uint8_t>& data) {
    return {data.begin(), data.end()};
}

}  // namespace

class TransportTest : public ::testing::Test {
protected:
    void TearDown() override {
        server_.stop_serving();
        workers_.shutdown();
    }

    /// Listen on an ephemeral port and echo every payload back, prefixed with the peer.
    void serve_echo(size_t connection_limit = TcpTransport::DEFAULT_CONNECTION_LIMIT) {
        ASSERT_TRUE(server_.listen("127.0.0.1", 0).has_value());
        ASSERT_NE(server_.bound_port(), 0);
        server_.set_connection_limit(connection_limit);
        server_.serve([](const std::vector<uint8_t>& request, const std::string& peer) {
            if (text(request) == "boom") throw std::runtime_error("handler failed");
            return bytes(peer + "|" + text(request));
        }, workers_);
    }

    /// Open @p count connections that never send a byte.
    std::vector<std::unique_ptr<TcpTransport>> open_silent(int count) {
        std::vector<std::unique_ptr<TcpTransport>> silent;
        for (int i = 0; i < count; ++i) {
            auto client = std::make_unique<TcpTransport>();
            EXPECT_TRUE(client->connect("127.0.0.1", server_.bound_port()).has_value());
            silent.push_back(std::move(client));
        }
        return silent;
    }

    TcpTransport server_;
    ThreadPool workers_{2};
};

TEST_F(TransportTest, RequestResponseRoundTrip) {
    serve_echo();

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_.bound_port(), 1000).has_value());
    EXPECT_TRUE(client.is_connected());

    ASSERT_TRUE(client.send(bytes("hello")).has_value());
    auto reply = client.receive(2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(text(*reply), "127.0.0.1|hello");
}

TEST_F(TransportTest, ConnectionCarriesManyExchanges) {
    serve_echo();

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_.bound_port()).has_value());
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(client.send(bytes("msg-" + std::to_string(i))).has_value());
        auto reply = client.receive(2000);
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ(text(*reply), "127.0.0.1|msg-" + std::to_string(i));
    }
    EXPECT_EQ(server_.connections_accepted(), 1u);
}

TEST_F(TransportTest, EmptyAndLargePayloads) {
    serve_echo();

    TcpTransport client;
    ASSERT_TRUE(client.connect("localhost", server_.bound_port()).has_value());

    ASSERT_TRUE(client.send({}).has_value());
    auto empty = client.receive(2000);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(text(*empty), "127.0.0.1|");

    std::string large(1 << 20, 'x');
    ASSERT_TRUE(client.send(bytes(large)).has_value());
    auto reply = client.receive(5000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->size(), large.size() + std::string("127.0.0.1|").size());
}

TEST_F(TransportTest, ConcurrentClients) {
    serve_echo();

    std::vector<std::thread> clients;
    std::atomic<int> ok{0};
    for (int c = 0; c < 4; ++c) {
        clients.emplace_back([&, c] {
            TcpTransport client;
            if (!client.connect("127.0.0.1", server_.bound_port())) return;
            auto payload = "client-" + std::to_string(c);
            if (!client.send(bytes(payload))) return;
            auto reply = client.receive(3000);
            if (reply && text(*reply) == "127.0.0.1|" + payload) ++ok;
        });
    }
    for (auto& t : clients) t.join();
    EXPECT_EQ(ok.load(), 4);
}

TEST_F(TransportTest, SilentConnectionsDoNotHoldWorkers) {
    serve_echo();

    // Three times as many idle sockets as workers
    auto silent = open_silent(6);
    ASSERT_TRUE(wait_until([&] { return server_.open_connections() == 6; }));

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_.bound_port()).has_value());
    ASSERT_TRUE(client.send(bytes("hi")).has_value());
    auto reply = client.receive(2000);
    ASSERT_TRUE(reply.has_value()) << reply.error().message;
    EXPECT_EQ(text(*reply), "127.0.0.1|hi");

    // The idle ones are still served once they speak
    ASSERT_TRUE(silent.front()->send(bytes("late")).has_value());
    auto late = silent.front()->receive(2000);
    ASSERT_TRUE(late.has_value());
    EXPECT_EQ(text(*late), "127.0.0.1|late");
}

TEST_F(TransportTest, ConnectionsBeyondLimitAreClosed) {
    serve_echo(2);

    auto admitted = open_silent(2);
    ASSERT_TRUE(wait_until([&] { return server_.connections_accepted() == 2; }));

    TcpTransport extra;
    ASSERT_TRUE(extra.connect("127.0.0.1", server_.bound_port()).has_value());
    ASSERT_TRUE(wait_until([&] { return server_.connections_rejected() == 1; }));
    EXPECT_FALSE(extra.send(bytes("x")).has_value() && extra.receive(1000).has_value());

    ASSERT_TRUE(admitted.back()->send(bytes("still here")).has_value());
    auto reply = admitted.back()->receive(2000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(text(*reply), "127.0.0.1|still here");
    EXPECT_EQ(server_.open_connections(), 2u);
}

TEST_F(TransportTest, PipelinedRequestsAnsweredInOrder) {
    serve_echo();

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_.bound_port()).has_value());
    ASSERT_TRUE(client.send(bytes("first")).has_value());
    ASSERT_TRUE(client.send(bytes("second")).has_value());

    auto one = client.receive(2000);
    auto two = client.receive(2000);
    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(text(*one), "127.0.0.1|first");
    EXPECT_EQ(text(*two), "127.0.0.1|second");
}

TEST_F(TransportTest, ThrowingHandlerClosesOnlyItsConnection) {
    serve_echo();

    TcpTransport failing;
    ASSERT_TRUE(failing.connect("127.0.0.1", server_.bound_port()).has_value());
    ASSERT_TRUE(failing.send(bytes("boom")).has_value());
    EXPECT_FALSE(failing.receive(2000).has_value());
    ASSERT_TRUE(wait_until([&] { return server_.open_connections() == 0; }));

    TcpTransport client;
    ASSERT_TRUE(client.connect("127.0.0.1", server_.bound_port()).has_value());
    ASSERT_TRUE(client.send(bytes("ok")).has_value());
    auto reply = client.receive(2000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(text(*reply), "127.0.0.1|ok");
}

TEST(Transport, ConnectToClosedPortFails) {
    uint16_t port = 0;
    {
        TcpTransport server;
        ASSERT_TRUE(server.listen("127.0.0.1", 0).has_value());
        port = server.bound_port();
    }

    TcpTransport client;
    EXPECT_FALSE(client.connect("127.0.0.1", port, 500).has_value());
    EXPECT_FALSE(client.is_connected());
}

TEST(Transport, UnresolvableHostIsInvalidArgument) {
    TcpTransport client;
    auto result = client.connect("no-such-host.invalid", 80, 500);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(Transport, SendWithoutConnectionFails) {
    TcpTransport client;
    EXPECT_FALSE(client.send(bytes("x")).has_value());
    EXPECT_FALSE(client.receive(10).has_value());
}

TEST(Transport, ListenTwiceFails) {
    TcpTransport server;
    ASSERT_TRUE(server.listen("127.0.0.1", 0).has_value());
    EXPECT_TRUE(server.is_listening());
    EXPECT_FALSE(server.listen("127.0.0.1", 0).has_value());
    server.stop_serving();
    EXPECT_FALSE(server.is_listening());
}

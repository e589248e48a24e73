#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <pincer/client/gateway_connection.h>

#include "support/fake_transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pincer::client::test {

using test_support::FakeTransportFactory;
using namespace std::chrono_literals;

namespace {

class GatewayConnectionTest : public ::testing::Test {
protected:
    GatewayConnectionTest() {
        cfg.gatewayUrl = "ws://127.0.0.1:18789/pincer";
        cfg.reconnect.baseDelay = 1ms;
    }

    std::unique_ptr<GatewayConnection> makeConnection() {
        ConnectionEvents ev;
        ev.onStatusChange = [this](ConnectionState s) { states.push_back(s); };
        ev.onCommand = [this](protocol::CommandEnvelope cmd) { commands.push_back(std::move(cmd)); };
        ev.onError = [this](const Error& e) { errors.push_back(e); };
        ev.onReconnectScheduled = [this](int attempt, std::chrono::milliseconds delay) {
            scheduled.emplace_back(attempt, delay);
        };
        return std::make_unique<GatewayConnection>(io.get_executor(), cfg, factory.make(),
                                                   std::move(ev));
    }

    boost::asio::io_context io;
    FakeTransportFactory factory;
    config::ClientConfig cfg;
    std::vector<ConnectionState> states;
    std::vector<protocol::CommandEnvelope> commands;
    std::vector<Error> errors;
    std::vector<std::pair<int, std::chrono::milliseconds>> scheduled;
};

} // namespace

TEST_F(GatewayConnectionTest, OpenMovesToConnectedAndResetsAttempts) {
    auto conn = makeConnection();
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    conn->connect();
    EXPECT_EQ(conn->state(), ConnectionState::Connecting);
    ASSERT_EQ(factory.created.size(), 1u);
    EXPECT_EQ(factory.last().openedUrl, "ws://127.0.0.1:18789/pincer");

    // Already connecting: no second transport.
    conn->connect();
    EXPECT_EQ(factory.created.size(), 1u);

    factory.last().simulateOpen();
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
    EXPECT_EQ(conn->reconnectAttempts(), 0);
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connecting,
                                                    ConnectionState::Connected}));
}

TEST_F(GatewayConnectionTest, BackoffDoublesUntilAttemptsAreExhausted) {
    factory.failOnOpen = true;
    auto conn = makeConnection();
    conn->connect();
    io.run();

    std::vector<std::pair<int, std::chrono::milliseconds>> expected{
        {1, 1ms}, {2, 2ms}, {3, 4ms}, {4, 8ms}, {5, 16ms}};
    EXPECT_EQ(scheduled, expected);
    // Initial attempt plus five retries, then nothing further is scheduled.
    EXPECT_EQ(factory.created.size(), 6u);
    EXPECT_FALSE(conn->reconnectPending());
    EXPECT_EQ(conn->reconnectAttempts(), 5);
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    EXPECT_EQ(errors.size(), 6u);
}

TEST_F(GatewayConnectionTest, ErrorFollowedByCloseArmsOneTimer) {
    auto conn = makeConnection();
    conn->connect();
    factory.last().simulateOpen();

    factory.last().simulateError("reset by peer");
    EXPECT_EQ(conn->state(), ConnectionState::Error);
    EXPECT_FALSE(conn->reconnectPending());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::NetworkError);

    factory.last().simulateClose();
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(conn->reconnectPending());
    ASSERT_EQ(scheduled.size(), 1u);
    EXPECT_EQ(scheduled[0].first, 1);

    io.run();
    EXPECT_EQ(factory.created.size(), 2u);
    EXPECT_EQ(conn->state(), ConnectionState::Connecting);
}

TEST_F(GatewayConnectionTest, DisconnectCancelsPendingReconnect) {
    auto conn = makeConnection();
    conn->connect();
    factory.last().simulateClose();
    ASSERT_TRUE(conn->reconnectPending());

    conn->disconnect();
    EXPECT_FALSE(conn->reconnectPending());
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    io.run();
    EXPECT_EQ(factory.created.size(), 1u);
}

TEST_F(GatewayConnectionTest, DisconnectSuppressesAutomaticReconnect) {
    auto conn = makeConnection();
    conn->connect();
    auto& first = factory.last();
    first.simulateOpen();

    conn->disconnect();
    EXPECT_EQ(first.closeCalls, 1);
    // The old transport reporting its close afterwards belongs to a stale attempt.
    first.simulateClose();
    EXPECT_FALSE(conn->reconnectPending());
    EXPECT_TRUE(scheduled.empty());
    io.run();
    EXPECT_EQ(factory.created.size(), 1u);
}

TEST_F(GatewayConnectionTest, ExplicitConnectAfterExhaustionMakesOneAttempt) {
    cfg.reconnect.maxAttempts = 2;
    factory.failOnOpen = true;
    auto conn = makeConnection();
    conn->connect();
    io.run();
    ASSERT_EQ(factory.created.size(), 3u);
    ASSERT_FALSE(conn->reconnectPending());

    factory.failOnOpen = false;
    conn->connect();
    ASSERT_EQ(factory.created.size(), 4u);
    factory.last().simulateOpen();
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
    EXPECT_EQ(conn->reconnectAttempts(), 0);
}

TEST_F(GatewayConnectionTest, StaleTransportCallbacksAreIgnored) {
    auto conn = makeConnection();
    conn->connect();
    auto& stale = factory.last();
    conn->disconnect();
    conn->connect();
    ASSERT_EQ(factory.created.size(), 2u);

    stale.simulateOpen();
    EXPECT_EQ(conn->state(), ConnectionState::Connecting);
    stale.simulateMessage(R"({"type":"get_context","requestId":"r1"})");
    EXPECT_TRUE(commands.empty());
    stale.simulateError("late");
    EXPECT_TRUE(errors.empty());

    factory.last().simulateOpen();
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
}

TEST_F(GatewayConnectionTest, CommandsAreParsedAndMalformedFramesDropped) {
    auto conn = makeConnection();
    conn->connect();
    factory.last().simulateOpen();

    factory.last().simulateMessage("{not json");
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
    EXPECT_TRUE(commands.empty());

    factory.last().simulateMessage(R"({"type":"click","requestId":"r9","ref":"e1"})");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].requestId, "r9");
    EXPECT_TRUE(std::holds_alternative<protocol::ClickCommand>(commands[0].body));
}

TEST_F(GatewayConnectionTest, SendRequiresConnectedState) {
    auto conn = makeConnection();
    protocol::EventEnvelope ev{3, "https://a", 1, std::nullopt, protocol::SelectionEvent{"hi"}};
    EXPECT_FALSE(conn->send(ev));

    conn->connect();
    EXPECT_FALSE(conn->send(ev));
    factory.last().simulateOpen();
    EXPECT_TRUE(conn->send(ev));
    ASSERT_EQ(factory.last().sent.size(), 1u);
    auto wire = protocol::Json::parse(factory.last().sent[0]);
    EXPECT_EQ(wire["type"], "selection");
    EXPECT_EQ(wire["payload"]["text"], "hi");
}

TEST_F(GatewayConnectionTest, UnencodableEventIsNotSent) {
    auto conn = makeConnection();
    conn->connect();
    factory.last().simulateOpen();
    protocol::EventEnvelope ev{3, "https://a", 1, std::nullopt,
                               protocol::SelectionEvent{"\xff\xfe"}};
    bool sent = true;
    EXPECT_NO_THROW(sent = conn->send(ev));
    EXPECT_FALSE(sent);
    EXPECT_TRUE(factory.last().sent.empty());
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
}

TEST_F(GatewayConnectionTest, ConnectUrlCarriesEncodedToken) {
    cfg.token = "a b&c";
    auto conn = makeConnection();
    EXPECT_EQ(conn->connectUrl(), "ws://127.0.0.1:18789/pincer?token=a%20b%26c");

    auto updated = cfg;
    updated.gatewayUrl = "ws://h:1/p?v=2";
    updated.token = "t";
    conn->updateConfig(updated);
    EXPECT_EQ(conn->connectUrl(), "ws://h:1/p?v=2&token=t");

    conn->connect();
    EXPECT_EQ(factory.last().openedUrl, "ws://h:1/p?v=2&token=t");
}

TEST_F(GatewayConnectionTest, MissingTransportReportsInternalError) {
    ConnectionEvents ev;
    ev.onError = [this](const Error& e) { errors.push_back(e); };
    GatewayConnection conn(io.get_executor(), cfg, TransportFactory{}, std::move(ev));
    conn.connect();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::InternalError);
    EXPECT_EQ(conn.state(), ConnectionState::Disconnected);
}

TEST(ConnectionStateTest, NamesMatchStatusStrings) {
    static_assert(connectionStateName(ConnectionState::Connected) == "connected");
    EXPECT_EQ(connectionStateName(ConnectionState::Disconnected), "disconnected");
    EXPECT_EQ(connectionStateName(ConnectionState::Connecting), "connecting");
    EXPECT_EQ(connectionStateName(ConnectionState::Error), "error");
}

} // namespace pincer::client::test

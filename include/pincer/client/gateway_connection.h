#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>

#include <pincer/client/client_transport.h>
#include <pincer/config/bridge_config.h>
#include <pincer/core/types.h>
#include <pincer/protocol/envelope.h>

namespace pincer::client {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

constexpr std::string_view connectionStateName(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Error:
            return "error";
    }
    return "unknown";
}

struct ConnectionEvents {
    std::function<void(ConnectionState)> onStatusChange;
    std::function<void(protocol::CommandEnvelope)> onCommand;
    std::function<void(const Error&)> onError;
    // attempt is 1-based: the first retry after a close reports 1 with the base delay.
    std::function<void(int attempt, std::chrono::milliseconds delay)> onReconnectScheduled;
};

/**
 * Client side of the gateway socket with exponential reconnect backoff.
 *
 * Every attempt gets a fresh transport and a generation number; callbacks from an older
 * generation are ignored. Only the close transition schedules a reconnect, so an error followed
 * by its close arms at most one timer. Events are delivered without internal locks held.
 *
 * The executor must outlive the connection.
 */
class GatewayConnection {
public:
    GatewayConnection(boost::asio::any_io_executor executor, config::ClientConfig cfg,
                      TransportFactory factory, ConnectionEvents events);
    ~GatewayConnection();

    GatewayConnection(const GatewayConnection&) = delete;
    GatewayConnection& operator=(const GatewayConnection&) = delete;

    // No-op while Connecting or Connected. Cancels a pending reconnect timer.
    void connect();
    // Cancels any reconnect timer and suppresses automatic reconnect until the next open.
    void disconnect();
    // False unless Connected.
    bool send(const protocol::EventEnvelope& event);
    // Applies to the next attempt.
    void updateConfig(config::ClientConfig cfg);

    ConnectionState state() const;
    int reconnectAttempts() const;
    bool reconnectPending() const;
    // Gateway URL with the token appended as a query parameter.
    std::string connectUrl() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace pincer::client
